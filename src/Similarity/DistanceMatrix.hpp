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
 * PhishShape — Pairwise Distance Matrix
 * ============================================================================
 *
 * @file DistanceMatrix.hpp
 * @brief Symmetric N×N NCD table over a sample pool
 *
 * Only the upper triangle is computed; each value is mirrored. The
 * diagonal is exactly zero. Cells are independent, so construction can
 * be spread over worker threads by row.
 *
 * Lifetime:
 *   Scoped to a single selection or clustering run, never persisted.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "NcdMetric.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <thread>
#include <vector>

namespace PhishShape::Similarity {

    /// Starts one worker running the given job
    using WorkerLauncher = std::function<std::thread(std::function<void()>)>;

    struct DistanceMatrixOptions {
        /// Worker threads for cell computation; 0 selects hardware concurrency
        size_t workerCount = 1;

        /**
         * Null starts plain std::threads. If starting a worker throws
         * std::system_error, the workers already running finish the
         * matrix, or the calling thread does when none started.
         */
        WorkerLauncher launcher;
    };

    class DistanceMatrix final {
    public:
        DistanceMatrix() = default;

        /// Zero-filled n×n matrix
        explicit DistanceMatrix(size_t n);

        /**
         * @brief Build from row-major values.
         *
         * @throws std::invalid_argument if the table is not n×n, not
         *         symmetric, or has a non-zero diagonal
         */
        [[nodiscard]] static DistanceMatrix FromValues(size_t n, std::vector<double> values);

        [[nodiscard]] size_t Size() const noexcept { return m_size; }
        [[nodiscard]] bool Empty() const noexcept { return m_size == 0; }

        /// Unchecked access
        [[nodiscard]] double operator()(size_t i, size_t j) const noexcept {
            return m_values[i * m_size + j];
        }

        /// @throws std::out_of_range on a bad index
        [[nodiscard]] double At(size_t i, size_t j) const;

        /**
         * @brief Store a value at (i, j) and (j, i).
         *
         * Writes to the diagonal are ignored.
         */
        void SetSymmetric(size_t i, size_t j, double value) noexcept;

        /// Mean distance from @p i to every other point (0 for n < 2)
        [[nodiscard]] double AverageDistance(size_t i) const noexcept;

    private:
        size_t m_size = 0;
        std::vector<double> m_values;
    };

    /**
     * @brief Compute NCD over every unordered pair of @p items.
     *
     * O(n²) joint compressions. Progress is logged at Info level.
     *
     * @throws CompressionError if any cell fails
     */
    [[nodiscard]] DistanceMatrix ComputeDistanceMatrix(
        const std::vector<std::span<const uint8_t>>& items,
        const NcdMetric& metric,
        const DistanceMatrixOptions& options = {});

} // namespace PhishShape::Similarity
