/*
 * PhishShape - Compression-Distance Phishing Classifier
 * Copyright (C) 2026 ShadowStrike Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
/**
 * ============================================================================
 * PhishShape — Normalized Compression Distance
 * ============================================================================
 *
 * @file NcdMetric.hpp
 * @brief NCD(x, y) = (C(x‖y) − min(C(x), C(y))) / max(C(x), C(y))
 *
 * Based on:
 *   - Cilibrasi, R., Vitányi, P. (2005). "Clustering by compression."
 *     IEEE Transactions on Information Theory, 51(4), 1523-1545.
 *
 * Properties preserved here:
 *   - Byte-identical inputs return exactly 0. The xz container adds
 *     framing, so the raw formula is slightly positive for x‖x.
 *   - Negative values are clamped to 0.
 *   - Values can exceed 1 on tiny inputs where framing dominates.
 *
 * Cost:
 *   Two memoized single compressions plus one uncached joint compression.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "CompressionOracle.hpp"

#include <cstdint>
#include <span>

namespace PhishShape::Similarity {

    /// Distance reported for comparisons that cannot be made
    inline constexpr double kMaxDistance = 1.0;

    class NcdMetric final {
    public:
        /**
         * @param oracle Shared compressor; must outlive the metric
         */
        explicit NcdMetric(const CompressionOracle& oracle) noexcept
            : m_oracle(&oracle) {}

        /**
         * @brief Normalized compression distance between two sequences.
         *
         * @throws CompressionError on compressor failure
         */
        [[nodiscard]] double Distance(std::span<const uint8_t> x,
                                      std::span<const uint8_t> y) const;

        [[nodiscard]] double operator()(std::span<const uint8_t> x,
                                        std::span<const uint8_t> y) const {
            return Distance(x, y);
        }

        [[nodiscard]] const CompressionOracle& Oracle() const noexcept { return *m_oracle; }

    private:
        const CompressionOracle* m_oracle;
    };

    /**
     * @brief Combine three compressed sizes into an NCD value.
     *
     * Exposed for callers that already hold the sizes.
     */
    [[nodiscard]] double NcdFromSizes(size_t cx, size_t cy, size_t cxy) noexcept;

} // namespace PhishShape::Similarity
