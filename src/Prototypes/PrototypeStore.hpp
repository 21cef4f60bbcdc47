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
 * PhishShape — Prototype Store
 * ============================================================================
 *
 * @file PrototypeStore.hpp
 * @brief Immutable reference collections used at classification time
 *
 * Holds one legitimate collection and one or more phishing clusters.
 * Built once from disk and shared as std::shared_ptr<const PrototypeStore>;
 * a rebuilt store replaces the old one as a whole.
 *
 * On-disk layouts (relative to a prototype root):
 * @code
 *   Flat:       phishing/<id>.dom                       legitimate/<id>.dom
 *   Clustered:  phishing_clustered/cluster_<N>/<id>.dom  legitimate/<id>.dom
 * @endcode
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "Sample.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace PhishShape::Prototypes {

    inline constexpr std::string_view kPhishingDirName = "phishing";
    inline constexpr std::string_view kLegitimateDirName = "legitimate";
    inline constexpr std::string_view kClusteredDirName = "phishing_clustered";
    inline constexpr std::string_view kClusterDirPrefix = "cluster_";

    enum class StoreLayout : uint8_t {
        Flat,
        Clustered
    };

    /**
     * @brief A labeled reference byte sequence.
     */
    struct Prototype {
        std::vector<uint8_t> bytes;
        Label label = Label::Legit;
        uint32_t clusterId = 0;     ///< 1-based cluster number for phishing, 0 for legit
        std::string sourceId;       ///< Originating file base name
        std::string url;            ///< Originating URL when recorded

        [[nodiscard]] size_t Size() const noexcept { return bytes.size(); }

        [[nodiscard]] std::span<const uint8_t> View() const noexcept {
            return { bytes.data(), bytes.size() };
        }
    };

    struct PrototypeCluster {
        uint32_t id = 0;
        std::vector<Prototype> prototypes;
    };

    class PrototypeStore final {
    public:
        /// Empty store; every classification against it is "unknown"
        PrototypeStore() = default;

        /**
         * @brief Assemble a store from in-memory collections.
         *
         * Empty clusters are dropped. Cluster order is preserved.
         */
        PrototypeStore(std::vector<Prototype> legitimate, std::vector<PrototypeCluster> phishingClusters);

        /**
         * @brief Load the flat layout; all phishing prototypes form cluster 1.
         *
         * Missing directories yield empty collections with a warning.
         */
        [[nodiscard]] static std::shared_ptr<const PrototypeStore> LoadFlat(
            const std::filesystem::path& phishingDir,
            const std::filesystem::path& legitimateDir);

        /**
         * @brief Load every cluster_<N> subdirectory plus the legitimate set.
         *
         * Clusters are ordered by N.
         */
        [[nodiscard]] static std::shared_ptr<const PrototypeStore> LoadClustered(
            const std::filesystem::path& clusteredDir,
            const std::filesystem::path& legitimateDir);

        /**
         * @brief Load either layout below a prototype root directory.
         */
        [[nodiscard]] static std::shared_ptr<const PrototypeStore> LoadFromRoot(
            const std::filesystem::path& root, StoreLayout layout);

        [[nodiscard]] const std::vector<Prototype>& Legitimate() const noexcept { return m_legitimate; }
        [[nodiscard]] const std::vector<PrototypeCluster>& PhishingClusters() const noexcept { return m_clusters; }

        [[nodiscard]] size_t LegitimateCount() const noexcept { return m_legitimate.size(); }
        [[nodiscard]] size_t PhishingCount() const noexcept;
        [[nodiscard]] size_t ClusterCount() const noexcept { return m_clusters.size(); }

        [[nodiscard]] bool HasLegitimate() const noexcept { return !m_legitimate.empty(); }
        [[nodiscard]] bool HasPhishing() const noexcept { return !m_clusters.empty(); }

        /// Summary for logs and diagnostics
        [[nodiscard]] std::string ToJson() const;

    private:
        std::vector<Prototype> m_legitimate;
        std::vector<PrototypeCluster> m_clusters;
    };

} // namespace PhishShape::Prototypes
