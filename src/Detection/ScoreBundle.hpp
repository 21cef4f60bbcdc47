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
#pragma once

#include "../Similarity/NcdMetric.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace PhishShape::Detection {

    /// Distances from one subject to one phishing cluster
    struct ClusterScore {
        uint32_t clusterId = 0;
        double min = Similarity::kMaxDistance;
        double avg = Similarity::kMaxDistance;
        size_t count = 0;
    };

    /**
     * @brief Raw distances from one subject to the whole prototype store.
     *
     * A class with no prototypes keeps the maximal distance 1.0.
     */
    struct ScoreBundle {
        double phishMin = Similarity::kMaxDistance;
        double phishAvg = Similarity::kMaxDistance;   ///< Mean over every phishing distance
        double legitMin = Similarity::kMaxDistance;
        double legitAvg = Similarity::kMaxDistance;

        std::vector<ClusterScore> clusters;

        /// Cluster holding phishMin; lowest id on ties
        std::optional<uint32_t> bestCluster;

        size_t phishCount = 0;
        size_t legitCount = 0;

        [[nodiscard]] bool HasPhishing() const noexcept { return phishCount > 0; }
        [[nodiscard]] bool HasLegitimate() const noexcept { return legitCount > 0; }
    };

} // namespace PhishShape::Detection
