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
 * PhishShape — Offline Prototype Builder
 * ============================================================================
 *
 * @file PrototypeBuilder.hpp
 * @brief Turns a labeled sample pool into the on-disk prototype layouts
 *
 * Three offline jobs share one distance-matrix pass each:
 *   - BuildPrototypes: k diverse prototypes per class (flat layout)
 *   - ClusterPhishingPool: 2..4 structural families (clustered layout)
 *   - TuneThreshold: legit/legit vs legit/phish distance distributions
 *
 * None of these run on the classification path.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "PrototypeStore.hpp"
#include "Sample.hpp"
#include "../Similarity/DistanceMatrix.hpp"
#include "../Similarity/FpfClusterer.hpp"
#include "../Similarity/NcdMetric.hpp"
#include "../Utils/FileUtils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace PhishShape::Prototypes {

    /// Default prototypes per class
    inline constexpr size_t kDefaultPrototypesPerClass = 5;

    struct BuildOptions {
        size_t k = kDefaultPrototypesPerClass;
        Similarity::FpfConfig fpf;
        Similarity::DistanceMatrixOptions matrix;
    };

    struct ClassBuildSummary {
        size_t poolSize = 0;
        std::vector<std::string> selectedIds;   ///< Source ids in selection order
        std::vector<std::string> writtenFiles;  ///< Prototype file names
    };

    struct BuildSummary {
        ClassBuildSummary phishing;
        ClassBuildSummary legitimate;
    };

    /**
     * @brief <label>_prototype_NN.dom, NN 1-based and zero padded to two digits.
     */
    [[nodiscard]] std::string PrototypeFileName(Label label, size_t ordinal);

    /**
     * @brief FPF-select @p k diverse members of one same-label pool.
     *
     * @return pool indices in selection order (whole pool when k >= size)
     * @throws std::invalid_argument if k == 0
     * @throws Similarity::CompressionError on compressor failure
     */
    [[nodiscard]] std::vector<size_t> SelectPrototypes(const std::vector<Sample>& pool,
                                                       size_t k,
                                                       const Similarity::NcdMetric& metric,
                                                       const Similarity::FpfConfig& fpf = {},
                                                       const Similarity::DistanceMatrixOptions& matrix = {});

    /**
     * @brief Write selected samples as prototype files into @p dir.
     *
     * Existing *_prototype_*.dom files (and their metadata) in @p dir are
     * removed first so a rebuild never mixes generations.
     *
     * @param clusterId Recorded in metadata when set
     */
    [[nodiscard]] bool WritePrototypes(const std::vector<const Sample*>& selected,
                                       Label label,
                                       const std::filesystem::path& dir,
                                       std::optional<uint32_t> clusterId,
                                       std::vector<std::string>* writtenFiles = nullptr,
                                       Utils::FileUtils::Error* err = nullptr);

    /**
     * @brief Full flat build: load @p samplesDir, select per class, write
     *        <outputDir>/phishing and <outputDir>/legitimate.
     *
     * A class with no samples is skipped with a warning.
     *
     * @return false on I/O failure
     * @throws std::invalid_argument if options.k == 0
     */
    [[nodiscard]] bool BuildPrototypes(const std::filesystem::path& samplesDir,
                                       const std::filesystem::path& outputDir,
                                       const BuildOptions& options,
                                       const Similarity::NcdMetric& metric,
                                       BuildSummary& summary,
                                       Utils::FileUtils::Error* err = nullptr);

    // ========================================================================
    // Clustering report
    // ========================================================================

    struct ClusterMember {
        std::string id;
        double distanceToCenter = 0.0;
    };

    struct ClusterReport {
        uint32_t id = 0;                ///< 1-based
        std::string centerId;
        size_t size = 0;
        double intraMin = 0.0;          ///< Over member pairs; 0 for singletons
        double intraMax = 0.0;
        double intraAvg = 0.0;
        std::vector<ClusterMember> members;
    };

    struct ClusterAnalysis {
        std::vector<ClusterReport> clusters;
        std::vector<Similarity::ClusteringStep> steps;

        [[nodiscard]] std::string ToJson() const;

        /// Human-readable multi-line report
        [[nodiscard]] std::string ToText() const;
    };

    [[nodiscard]] ClusterAnalysis AnalyzeClusters(const std::vector<Sample>& pool,
                                                  const Similarity::DistanceMatrix& distances,
                                                  const Similarity::ClusteringResult& clustering);

    /**
     * @brief Cluster the phishing pool and write <outputDir>/cluster_<N>/.
     *
     * @p outputDir is cleared first.
     *
     * @throws std::invalid_argument on an invalid clustering config
     */
    [[nodiscard]] bool ClusterPhishingPool(const std::vector<Sample>& pool,
                                           const std::filesystem::path& outputDir,
                                           const Similarity::ClusteringConfig& config,
                                           const Similarity::DistanceMatrixOptions& matrix,
                                           const Similarity::NcdMetric& metric,
                                           ClusterAnalysis& analysis,
                                           Utils::FileUtils::Error* err = nullptr);

    // ========================================================================
    // Threshold tuning
    // ========================================================================

    struct DistanceSummary {
        size_t count = 0;
        double min = 0.0;
        double max = 0.0;
        double mean = 0.0;

        [[nodiscard]] static DistanceSummary Of(const std::vector<double>& values) noexcept;
    };

    struct ThresholdReport {
        DistanceSummary legitToLegit;
        DistanceSummary legitToPhish;

        /// (max L→L + min L→P) / 2; empty if either side has no pairs
        std::optional<double> suggestedThreshold;

        [[nodiscard]] bool Separated() const noexcept {
            return suggestedThreshold && legitToLegit.max < legitToPhish.min;
        }

        [[nodiscard]] std::string ToJson() const;
    };

    /**
     * @brief Compare the store's collections against each other.
     *
     * Legit self pairs (distance 0) are excluded from the L→L distribution.
     */
    [[nodiscard]] ThresholdReport TuneThreshold(const PrototypeStore& store,
                                                const Similarity::NcdMetric& metric);

} // namespace PhishShape::Prototypes
