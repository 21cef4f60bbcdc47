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
 * PhishShape — Farthest-Point-First Selection and Clustering
 * ============================================================================
 *
 * @file FpfClusterer.hpp
 * @brief Greedy diverse-subset selection and structural clustering over a
 *        precomputed distance matrix
 *
 * Based on:
 *   - Gonzalez, T. (1985). "Clustering to minimize the maximum intercluster
 *     distance." Theoretical Computer Science, 38, 293-306.
 *
 * Both entry points share one step: given the selected set S, pick the
 * unselected point whose distance to its nearest member of S is largest.
 * Ties go to the lowest pool index.
 *
 * Selection is sequential by construction. Each step reads the running
 * nearest-center distances left by the previous step.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "DistanceMatrix.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace PhishShape::Similarity {

    /// Default upper bound on structural clusters
    inline constexpr size_t kDefaultMaxClusters = 4;

    /// Default lower bound before early stop is allowed
    inline constexpr size_t kDefaultMinClusters = 2;

    /// Default minimum variance reduction worth another cluster
    inline constexpr double kDefaultVarianceEpsilon = 0.001;

    enum class SeedPolicy : uint8_t {
        Random,                 ///< Uniform random first point
        HighestAverageDistance  ///< Most atypical point first
    };

    struct FpfConfig {
        SeedPolicy seedPolicy = SeedPolicy::Random;

        /// Fixed RNG seed for reproducible runs; random device otherwise
        std::optional<uint64_t> randomSeed;
    };

    struct ClusteringConfig {
        size_t maxClusters = kDefaultMaxClusters;
        size_t minClusters = kDefaultMinClusters;
        double epsilon = kDefaultVarianceEpsilon;

        [[nodiscard]] bool IsValid() const noexcept {
            return minClusters >= 1 && maxClusters >= minClusters && epsilon >= 0.0;
        }
    };

    /**
     * @brief One candidate considered during clustering.
     */
    struct ClusteringStep {
        size_t candidate = 0;           ///< Pool index proposed as next center
        double distanceToCenters = 0.0; ///< Its distance to the nearest existing center
        double varianceBefore = 0.0;
        double varianceAfter = 0.0;
        bool accepted = false;

        [[nodiscard]] double Reduction() const noexcept { return varianceBefore - varianceAfter; }
    };

    struct ClusteringResult {
        /// Cluster index (into centers) for every pool point
        std::vector<size_t> assignments;

        /// Pool index of every cluster center, in selection order
        std::vector<size_t> centers;

        /// Candidates evaluated after the seed, in order
        std::vector<ClusteringStep> steps;

        [[nodiscard]] size_t ClusterCount() const noexcept { return centers.size(); }

        /// Pool indices grouped by cluster, each group in pool order
        [[nodiscard]] std::vector<std::vector<size_t>> Members() const;
    };

    /**
     * @brief Pick @p k mutually distant points.
     *
     * @return k unique pool indices in selection order; the whole pool in
     *         pool order when k >= n
     * @throws std::invalid_argument if k == 0
     */
    [[nodiscard]] std::vector<size_t> SelectDiverseSubset(const DistanceMatrix& distances,
                                                          size_t k,
                                                          const FpfConfig& config = {});

    /**
     * @brief Partition the pool around farthest-first centers.
     *
     * Seeds with the highest-average-distance point, adds centers while the
     * variance of nearest-center distance keeps dropping by at least
     * epsilon (always reaching minClusters, never exceeding maxClusters),
     * then assigns every point to its nearest center.
     *
     * @throws std::invalid_argument on an invalid config
     */
    [[nodiscard]] ClusteringResult ClusterPool(const DistanceMatrix& distances,
                                               const ClusteringConfig& config = {});

    /// Population variance, 0 for an empty range
    [[nodiscard]] double PopulationVariance(const std::vector<double>& values) noexcept;

} // namespace PhishShape::Similarity
