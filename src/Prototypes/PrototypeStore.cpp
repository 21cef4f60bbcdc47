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
#include "PrototypeStore.hpp"
#include "SampleRepository.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <charconv>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace PhishShape::Prototypes {

    namespace {

        [[nodiscard]] std::vector<Prototype> LoadCollection(const std::filesystem::path& dir,
                                                            Label label,
                                                            uint32_t clusterId) {
            std::vector<Prototype> prototypes;
            if (!Utils::FileUtils::IsDirectory(dir)) {
                PS_LOG_WARN("PrototypeStore", "Prototype folder not found: %s", dir.string().c_str());
                return prototypes;
            }

            std::vector<Sample> samples;
            Utils::FileUtils::Error err;
            if (!LoadSampleDirectory(dir, label, samples, &err)) {
                PS_LOG_ERROR("PrototypeStore", "Failed to load prototypes from %s: %s",
                             dir.string().c_str(), err.message.c_str());
                return prototypes;
            }

            prototypes.reserve(samples.size());
            for (auto& sample : samples) {
                Prototype p;
                p.bytes = std::move(sample.bytes);
                p.label = label;
                p.clusterId = clusterId;
                p.sourceId = std::move(sample.id);
                p.url = std::move(sample.url);
                prototypes.push_back(std::move(p));
            }
            return prototypes;
        }

        /// "cluster_3" → 3; nullopt for anything else, leading zeros included
        [[nodiscard]] std::optional<uint32_t> ParseClusterDirName(const std::string& name) noexcept {
            if (name.size() <= kClusterDirPrefix.size() ||
                name.compare(0, kClusterDirPrefix.size(), kClusterDirPrefix) != 0) {
                return std::nullopt;
            }
            uint32_t id = 0;
            const char* first = name.data() + kClusterDirPrefix.size();
            const char* last = name.data() + name.size();
            // One spelling per id: "cluster_01" would alias "cluster_1"
            if (*first == '0') {
                return std::nullopt;
            }
            const auto [ptr, ec] = std::from_chars(first, last, id);
            if (ec != std::errc{} || ptr != last || id == 0) {
                return std::nullopt;
            }
            return id;
        }

    } // anonymous namespace

    PrototypeStore::PrototypeStore(std::vector<Prototype> legitimate, std::vector<PrototypeCluster> phishingClusters)
        : m_legitimate(std::move(legitimate)) {
        for (auto& cluster : phishingClusters) {
            if (!cluster.prototypes.empty()) {
                m_clusters.push_back(std::move(cluster));
            }
        }
    }

    size_t PrototypeStore::PhishingCount() const noexcept {
        size_t total = 0;
        for (const auto& cluster : m_clusters) {
            total += cluster.prototypes.size();
        }
        return total;
    }

    std::shared_ptr<const PrototypeStore> PrototypeStore::LoadFlat(const std::filesystem::path& phishingDir,
                                                                   const std::filesystem::path& legitimateDir) {
        std::vector<PrototypeCluster> clusters;
        clusters.push_back(PrototypeCluster{ 1, LoadCollection(phishingDir, Label::Phish, 1) });

        auto store = std::make_shared<const PrototypeStore>(
            LoadCollection(legitimateDir, Label::Legit, 0), std::move(clusters));

        PS_LOG_INFO("PrototypeStore", "Prototype summary: %zu phishing, %zu legit",
                    store->PhishingCount(), store->LegitimateCount());
        return store;
    }

    std::shared_ptr<const PrototypeStore> PrototypeStore::LoadClustered(const std::filesystem::path& clusteredDir,
                                                                        const std::filesystem::path& legitimateDir) {
        std::vector<PrototypeCluster> clusters;

        std::vector<std::filesystem::path> subdirs;
        Utils::FileUtils::Error err;
        if (Utils::FileUtils::ListDirectories(clusteredDir, subdirs, &err)) {
            for (const auto& dir : subdirs) {
                const auto id = ParseClusterDirName(dir.filename().string());
                if (!id) {
                    PS_LOG_DEBUG("PrototypeStore", "Ignoring non-cluster directory %s", dir.string().c_str());
                    continue;
                }
                clusters.push_back(PrototypeCluster{ *id, LoadCollection(dir, Label::Phish, *id) });
            }
        }
        else {
            PS_LOG_WARN("PrototypeStore", "Clustered prototype folder not found: %s", clusteredDir.string().c_str());
        }

        // Name order puts cluster_10 before cluster_2
        std::sort(clusters.begin(), clusters.end(), [](const auto& a, const auto& b) { return a.id < b.id; });

        auto store = std::make_shared<const PrototypeStore>(
            LoadCollection(legitimateDir, Label::Legit, 0), std::move(clusters));

        PS_LOG_INFO("PrototypeStore", "Clustered prototype summary: %zu clusters, %zu phishing, %zu legit",
                    store->ClusterCount(), store->PhishingCount(), store->LegitimateCount());
        for (const auto& cluster : store->PhishingClusters()) {
            PS_LOG_INFO("PrototypeStore", "  Phishing cluster %u: %zu samples", cluster.id, cluster.prototypes.size());
        }
        return store;
    }

    std::shared_ptr<const PrototypeStore> PrototypeStore::LoadFromRoot(const std::filesystem::path& root,
                                                                       StoreLayout layout) {
        const auto legitDir = root / std::string(kLegitimateDirName);
        if (layout == StoreLayout::Clustered) {
            return LoadClustered(root / std::string(kClusteredDirName), legitDir);
        }
        return LoadFlat(root / std::string(kPhishingDirName), legitDir);
    }

    std::string PrototypeStore::ToJson() const {
        json j;
        j["legitimate"] = m_legitimate.size();
        j["phishing"] = PhishingCount();

        json clusters = json::array();
        for (const auto& cluster : m_clusters) {
            json c;
            c["id"] = cluster.id;
            c["size"] = cluster.prototypes.size();
            clusters.push_back(std::move(c));
        }
        j["clusters"] = std::move(clusters);
        return j.dump();
    }

} // namespace PhishShape::Prototypes
