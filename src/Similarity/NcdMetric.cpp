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
#include "NcdMetric.hpp"

#include <algorithm>
#include <cstring>

namespace PhishShape::Similarity {

    double NcdFromSizes(size_t cx, size_t cy, size_t cxy) noexcept {
        const size_t lo = std::min(cx, cy);
        const size_t hi = std::max(cx, cy);
        if (hi == 0) {
            return 0.0;
        }

        const double value = (static_cast<double>(cxy) - static_cast<double>(lo)) / static_cast<double>(hi);
        return value < 0.0 ? 0.0 : value;
    }

    double NcdMetric::Distance(std::span<const uint8_t> x, std::span<const uint8_t> y) const {
        if (!x.empty() && x.size() == y.size() &&
            (x.data() == y.data() || std::memcmp(x.data(), y.data(), x.size()) == 0)) {
            return 0.0;
        }

        const size_t cx = m_oracle->CompressedSize(x);
        const size_t cy = m_oracle->CompressedSize(y);
        const size_t cxy = m_oracle->ConcatenatedSize(x, y);

        return NcdFromSizes(cx, cy, cxy);
    }

} // namespace PhishShape::Similarity
