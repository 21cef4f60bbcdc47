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
 * PhishShape — Farthest-Point-First Implementation
 * ============================================================================
 *
 * @file FpfClusterer.cpp
 * @brief Greedy k-center selection with variance-based early stop
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "FpfClusterer.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

namespace PhishShape::Similarity {

    namespace {

        /**
         * @brief Index of the point with the largest mean distance to the pool.
         */
        [[nodiscard]] size_t MostAtypicalPoint(const DistanceMatrix& distances) noexcept {
            size_t best = 0;
            double bestAvg = -1.0;
            for (size_t i = 0; i < distances.Size(); ++i) {
                const double avg = distances.AverageDistance(i);
                if (avg > bestAvg) {
                    bestAvg = avg;
                    best = i;
                }
            }
            return best;
        }

        [[nodiscard]] size_t RandomPoint(size_t n, const std::optional<uint64_t>& seed) {
            std::mt19937_64 rng(seed ? *seed : std::random_device{}());
            std::uniform_int_distribution<size_t> pick(0, n - 1);
            return pick(rng);
        }

        /**
         * @brief Farthest unselected point given running nearest-center distances.
         *
         * Strict comparison keeps the lowest index on ties.
         *
         * @return n when every point is selected
         */
        [[nodiscard]] size_t FarthestUnselected(const std::vector<double>& nearest,
                                                const std::vector<bool>& selected) noexcept {
            size_t best = nearest.size();
            double bestDist = -1.0;
            for (size_t i = 0; i < nearest.size(); ++i) {
                if (selected[i]) continue;
                if (nearest[i] > bestDist) {
                    bestDist = nearest[i];
                    best = i;
                }
            }
            return best;
        }

        void AbsorbCenter(const DistanceMatrix& distances, size_t center, std::vector<double>& nearest) noexcept {
            for (size_t i = 0; i < nearest.size(); ++i) {
                nearest[i] = std::min(nearest[i], distances(center, i));
            }
        }

    } // anonymous namespace

    double PopulationVariance(const std::vector<double>& values) noexcept {
        if (values.empty()) return 0.0;

        const double n = static_cast<double>(values.size());
        const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
        double acc = 0.0;
        for (double v : values) {
            acc += (v - mean) * (v - mean);
        }
        return acc / n;
    }

    std::vector<std::vector<size_t>> ClusteringResult::Members() const {
        std::vector<std::vector<size_t>> groups(centers.size());
        for (size_t i = 0; i < assignments.size(); ++i) {
            groups[assignments[i]].push_back(i);
        }
        return groups;
    }

    std::vector<size_t> SelectDiverseSubset(const DistanceMatrix& distances, size_t k, const FpfConfig& config) {
        if (k == 0) {
            throw std::invalid_argument("FPF subset size must be at least 1");
        }

        const size_t n = distances.Size();
        if (k >= n) {
            PS_LOG_WARN("FPF", "Requested %zu prototypes from a pool of %zu; keeping the whole pool", k, n);
            std::vector<size_t> all(n);
            std::iota(all.begin(), all.end(), size_t{ 0 });
            return all;
        }

        const size_t seed = config.seedPolicy == SeedPolicy::Random
            ? RandomPoint(n, config.randomSeed)
            : MostAtypicalPoint(distances);

        std::vector<size_t> chosen;
        chosen.reserve(k);
        chosen.push_back(seed);

        std::vector<bool> selected(n, false);
        selected[seed] = true;

        std::vector<double> nearest(n);
        for (size_t i = 0; i < n; ++i) {
            nearest[i] = distances(seed, i);
        }

        PS_LOG_DEBUG("FPF", "Seed point %zu", seed);

        while (chosen.size() < k) {
            const size_t next = FarthestUnselected(nearest, selected);
            if (next == n) break;

            PS_LOG_DEBUG("FPF", "Selected point %zu (distance to set %.4f)", next, nearest[next]);
            chosen.push_back(next);
            selected[next] = true;
            AbsorbCenter(distances, next, nearest);
        }

        return chosen;
    }

    ClusteringResult ClusterPool(const DistanceMatrix& distances, const ClusteringConfig& config) {
        if (!config.IsValid()) {
            throw std::invalid_argument("invalid clustering config: minClusters=" +
                                        std::to_string(config.minClusters) + " maxClusters=" +
                                        std::to_string(config.maxClusters));
        }

        ClusteringResult result;
        const size_t n = distances.Size();
        if (n == 0) {
            return result;
        }

        const size_t seed = MostAtypicalPoint(distances);
        result.centers.push_back(seed);

        std::vector<bool> isCenter(n, false);
        isCenter[seed] = true;

        std::vector<double> nearest(n);
        for (size_t i = 0; i < n; ++i) {
            nearest[i] = distances(seed, i);
        }

        PS_LOG_INFO("FPF", "Initial center: point %zu (average distance %.4f)",
                    seed, distances.AverageDistance(seed));

        while (result.centers.size() < config.maxClusters) {
            const size_t candidate = FarthestUnselected(nearest, isCenter);
            if (candidate == n) break;

            std::vector<double> trial = nearest;
            AbsorbCenter(distances, candidate, trial);

            ClusteringStep step;
            step.candidate = candidate;
            step.distanceToCenters = nearest[candidate];
            step.varianceBefore = PopulationVariance(nearest);
            step.varianceAfter = PopulationVariance(trial);

            const bool enoughClusters = result.centers.size() >= config.minClusters;
            if (enoughClusters && step.Reduction() < config.epsilon) {
                PS_LOG_INFO("FPF", "Stopping at %zu clusters: variance reduction %.6f below %.6f",
                            result.centers.size(), step.Reduction(), config.epsilon);
                result.steps.push_back(step);
                break;
            }

            step.accepted = true;
            result.steps.push_back(step);
            result.centers.push_back(candidate);
            isCenter[candidate] = true;
            nearest = std::move(trial);

            PS_LOG_INFO("FPF", "Cluster %zu center: point %zu (distance %.4f, variance reduction %.6f)",
                        result.centers.size(), candidate, step.distanceToCenters, step.Reduction());
        }

        result.assignments.resize(n);
        for (size_t i = 0; i < n; ++i) {
            size_t bestCluster = 0;
            double bestDist = distances(i, result.centers[0]);
            for (size_t c = 1; c < result.centers.size(); ++c) {
                const double d = distances(i, result.centers[c]);
                if (d < bestDist) {
                    bestDist = d;
                    bestCluster = c;
                }
            }
            result.assignments[i] = bestCluster;
        }

        return result;
    }

} // namespace PhishShape::Similarity
