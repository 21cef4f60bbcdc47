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
#include "PrototypeBuilder.hpp"
#include "SampleRepository.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace PhishShape::Prototypes {

    using Similarity::DistanceMatrix;
    using Similarity::NcdMetric;
    using Utils::JSON::Json;

    namespace {

        constexpr std::string_view kPrototypeInfix = "_prototype_";

        [[nodiscard]] std::vector<std::span<const uint8_t>> Views(const std::vector<Sample>& pool) {
            std::vector<std::span<const uint8_t>> views;
            views.reserve(pool.size());
            for (const auto& s : pool) {
                views.push_back(s.View());
            }
            return views;
        }

        [[nodiscard]] bool WriteMeta(const std::filesystem::path& domPath,
                                     const Sample& sample,
                                     Label label,
                                     std::optional<uint32_t> clusterId,
                                     Utils::FileUtils::Error* err) {
            Json meta;
            meta["label"] = LabelToString(label);
            meta["url"] = sample.url;
            meta["size"] = sample.bytes.size();
            meta["source"] = sample.id;
            if (clusterId) {
                meta["cluster"] = *clusterId;
            }

            Utils::JSON::SaveOptions opt;
            opt.pretty = true;
            Utils::JSON::Error jsonErr;
            if (!Utils::JSON::SaveToFile(MetaPathFor(domPath), meta, &jsonErr, opt)) {
                if (err) err->message = jsonErr.message;
                return false;
            }
            return true;
        }

        /// Remove a previous generation of prototype files from @p dir
        [[nodiscard]] bool ClearPrototypeFiles(const std::filesystem::path& dir, Utils::FileUtils::Error* err) {
            if (!Utils::FileUtils::IsDirectory(dir)) {
                return true;
            }
            std::vector<std::filesystem::path> files;
            if (!Utils::FileUtils::ListFiles(dir, kDomExtension, files, err)) {
                return false;
            }
            for (const auto& path : files) {
                if (path.filename().string().find(kPrototypeInfix) == std::string::npos) {
                    continue;
                }
                if (!Utils::FileUtils::RemoveFile(path, err) ||
                    !Utils::FileUtils::RemoveFile(MetaPathFor(path), err)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] std::string FormatDistance(double value) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(4) << value;
            return oss.str();
        }

        /// Pairs i<j only; the diagonal never enters intra-cluster statistics
        void FillIntraClusterStats(ClusterReport& report,
                                   const std::vector<size_t>& members,
                                   const DistanceMatrix& distances) {
            double sum = 0.0;
            size_t pairs = 0;
            double lo = std::numeric_limits<double>::max();
            double hi = 0.0;
            for (size_t a = 0; a < members.size(); ++a) {
                for (size_t b = a + 1; b < members.size(); ++b) {
                    const double d = distances(members[a], members[b]);
                    lo = std::min(lo, d);
                    hi = std::max(hi, d);
                    sum += d;
                    ++pairs;
                }
            }
            if (pairs > 0) {
                report.intraMin = lo;
                report.intraMax = hi;
                report.intraAvg = sum / static_cast<double>(pairs);
            }
        }

    } // anonymous namespace

    std::string PrototypeFileName(Label label, size_t ordinal) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%02zu", ordinal);
        return std::string(LabelToString(label)) + std::string(kPrototypeInfix) + buf + std::string(kDomExtension);
    }

    std::vector<size_t> SelectPrototypes(const std::vector<Sample>& pool,
                                         size_t k,
                                         const NcdMetric& metric,
                                         const Similarity::FpfConfig& fpf,
                                         const Similarity::DistanceMatrixOptions& matrix) {
        if (k == 0) {
            throw std::invalid_argument("SelectPrototypes: k must be positive");
        }
        if (pool.empty()) {
            return {};
        }
        if (k >= pool.size()) {
            PS_LOG_WARN("Builder", "Requested %zu prototypes from a pool of %zu; keeping all", k, pool.size());
            std::vector<size_t> all(pool.size());
            for (size_t i = 0; i < all.size(); ++i) all[i] = i;
            return all;
        }

        const DistanceMatrix distances = Similarity::ComputeDistanceMatrix(Views(pool), metric, matrix);
        return Similarity::SelectDiverseSubset(distances, k, fpf);
    }

    bool WritePrototypes(const std::vector<const Sample*>& selected,
                         Label label,
                         const std::filesystem::path& dir,
                         std::optional<uint32_t> clusterId,
                         std::vector<std::string>* writtenFiles,
                         Utils::FileUtils::Error* err) {
        if (!Utils::FileUtils::CreateDirectories(dir, err)) {
            return false;
        }
        if (!ClearPrototypeFiles(dir, err)) {
            PS_LOG_ERROR("Builder", "Failed to clear old prototypes in %s", dir.string().c_str());
            return false;
        }

        for (size_t i = 0; i < selected.size(); ++i) {
            const Sample& sample = *selected[i];
            const std::string name = PrototypeFileName(label, i + 1);
            const auto domPath = dir / name;

            if (!Utils::FileUtils::WriteAllBytesAtomic(domPath, sample.bytes.data(), sample.bytes.size(), err) ||
                !WriteMeta(domPath, sample, label, clusterId, err)) {
                PS_LOG_ERROR("Builder", "Failed to write prototype %s", domPath.string().c_str());
                return false;
            }
            if (writtenFiles) {
                writtenFiles->push_back(name);
            }
            PS_LOG_DEBUG("Builder", "Wrote %s from %s (%zu bytes)", name.c_str(), sample.id.c_str(), sample.bytes.size());
        }
        return true;
    }

    bool BuildPrototypes(const std::filesystem::path& samplesDir,
                         const std::filesystem::path& outputDir,
                         const BuildOptions& options,
                         const NcdMetric& metric,
                         BuildSummary& summary,
                         Utils::FileUtils::Error* err) {
        PS_LOG_SCOPE("Builder");
        if (options.k == 0) {
            throw std::invalid_argument("BuildPrototypes: k must be positive");
        }
        summary = BuildSummary{};

        LabeledPools pools;
        if (!LoadLabeledSamples(samplesDir, pools, err)) {
            return false;
        }

        const auto buildClass = [&](const std::vector<Sample>& pool, Label label,
                                    const std::filesystem::path& dir, ClassBuildSummary& out) -> bool {
            out.poolSize = pool.size();
            if (pool.empty()) {
                PS_LOG_WARN("Builder", "No %s samples found, skipping", LabelToString(label));
                return true;
            }

            PS_LOG_INFO("Builder", "Selecting %zu %s prototypes from %zu samples",
                        std::min(options.k, pool.size()), LabelToString(label), pool.size());

            const auto indices = SelectPrototypes(pool, options.k, metric, options.fpf, options.matrix);

            std::vector<const Sample*> selected;
            selected.reserve(indices.size());
            for (size_t idx : indices) {
                selected.push_back(&pool[idx]);
                out.selectedIds.push_back(pool[idx].id);
            }
            return WritePrototypes(selected, label, dir, std::nullopt, &out.writtenFiles, err);
        };

        if (!buildClass(pools.phishing, Label::Phish, outputDir / std::string(kPhishingDirName), summary.phishing) ||
            !buildClass(pools.legitimate, Label::Legit, outputDir / std::string(kLegitimateDirName), summary.legitimate)) {
            return false;
        }

        PS_LOG_INFO("Builder", "Prototype build complete: %zu phishing, %zu legitimate written to %s",
                    summary.phishing.writtenFiles.size(), summary.legitimate.writtenFiles.size(),
                    outputDir.string().c_str());
        return true;
    }

    // ========================================================================
    // Clustering
    // ========================================================================

    ClusterAnalysis AnalyzeClusters(const std::vector<Sample>& pool,
                                    const DistanceMatrix& distances,
                                    const Similarity::ClusteringResult& clustering) {
        ClusterAnalysis analysis;
        analysis.steps = clustering.steps;

        const auto groups = clustering.Members();
        for (size_t c = 0; c < groups.size(); ++c) {
            const size_t center = clustering.centers[c];

            ClusterReport report;
            report.id = static_cast<uint32_t>(c + 1);
            report.centerId = pool[center].id;
            report.size = groups[c].size();
            FillIntraClusterStats(report, groups[c], distances);

            for (size_t member : groups[c]) {
                report.members.push_back(ClusterMember{ pool[member].id, distances(member, center) });
            }
            analysis.clusters.push_back(std::move(report));
        }
        return analysis;
    }

    std::string ClusterAnalysis::ToJson() const {
        Json j;
        Json jc = Json::array();
        for (const auto& c : clusters) {
            Json members = Json::array();
            for (const auto& m : c.members) {
                members.push_back({ { "id", m.id }, { "distance_to_center", m.distanceToCenter } });
            }
            jc.push_back({
                { "cluster", c.id },
                { "center", c.centerId },
                { "size", c.size },
                { "intra_min", c.intraMin },
                { "intra_max", c.intraMax },
                { "intra_avg", c.intraAvg },
                { "members", std::move(members) }
            });
        }
        j["clusters"] = std::move(jc);

        Json js = Json::array();
        for (const auto& s : steps) {
            js.push_back({
                { "candidate", s.candidate },
                { "distance_to_centers", s.distanceToCenters },
                { "variance_reduction", s.Reduction() },
                { "accepted", s.accepted }
            });
        }
        j["steps"] = std::move(js);
        return j.dump(2);
    }

    std::string ClusterAnalysis::ToText() const {
        std::ostringstream oss;
        oss << "CLUSTER ANALYSIS\n";
        for (const auto& c : clusters) {
            oss << "\nCluster " << c.id << ":\n"
                << "  Size: " << c.size << " samples\n"
                << "  Center: " << c.centerId << "\n";
            if (c.size > 1) {
                oss << "  Intra-cluster distances: min=" << FormatDistance(c.intraMin)
                    << ", max=" << FormatDistance(c.intraMax)
                    << ", avg=" << FormatDistance(c.intraAvg) << "\n";
            }
            oss << "  Members:\n";
            for (const auto& m : c.members) {
                oss << "    - " << m.id << " (distance to center: " << FormatDistance(m.distanceToCenter) << ")\n";
            }
        }
        return oss.str();
    }

    bool ClusterPhishingPool(const std::vector<Sample>& pool,
                             const std::filesystem::path& outputDir,
                             const Similarity::ClusteringConfig& config,
                             const Similarity::DistanceMatrixOptions& matrix,
                             const NcdMetric& metric,
                             ClusterAnalysis& analysis,
                             Utils::FileUtils::Error* err) {
        PS_LOG_SCOPE("Builder");
        if (!config.IsValid()) {
            throw std::invalid_argument("ClusterPhishingPool: invalid clustering config");
        }
        analysis = ClusterAnalysis{};
        if (pool.empty()) {
            PS_LOG_WARN("Builder", "No phishing samples to cluster");
            return true;
        }

        PS_LOG_INFO("Builder", "Computing %zux%zu pairwise distances", pool.size(), pool.size());
        const DistanceMatrix distances = Similarity::ComputeDistanceMatrix(Views(pool), metric, matrix);
        const auto clustering = Similarity::ClusterPool(distances, config);
        analysis = AnalyzeClusters(pool, distances, clustering);

        if (!Utils::FileUtils::RemoveDirectoryRecursive(outputDir, err) ||
            !Utils::FileUtils::CreateDirectories(outputDir, err)) {
            PS_LOG_ERROR("Builder", "Failed to reset %s", outputDir.string().c_str());
            return false;
        }

        for (size_t i = 0; i < pool.size(); ++i) {
            const auto clusterId = static_cast<uint32_t>(clustering.assignments[i] + 1);
            const auto dir = outputDir / (std::string(kClusterDirPrefix) + std::to_string(clusterId));
            const auto domPath = dir / (pool[i].id + std::string(kDomExtension));

            if (!Utils::FileUtils::WriteAllBytesAtomic(domPath, pool[i].bytes.data(), pool[i].bytes.size(), err) ||
                !WriteMeta(domPath, pool[i], Label::Phish, clusterId, err)) {
                PS_LOG_ERROR("Builder", "Failed to write clustered sample %s", domPath.string().c_str());
                return false;
            }
        }

        for (const auto& c : analysis.clusters) {
            PS_LOG_INFO("Builder", "Cluster %u: %zu samples (center %s)", c.id, c.size, c.centerId.c_str());
        }
        return true;
    }

    // ========================================================================
    // Threshold tuning
    // ========================================================================

    DistanceSummary DistanceSummary::Of(const std::vector<double>& values) noexcept {
        DistanceSummary s;
        if (values.empty()) {
            return s;
        }
        s.count = values.size();
        s.min = *std::min_element(values.begin(), values.end());
        s.max = *std::max_element(values.begin(), values.end());
        double sum = 0.0;
        for (double v : values) sum += v;
        s.mean = sum / static_cast<double>(values.size());
        return s;
    }

    std::string ThresholdReport::ToJson() const {
        const auto summary = [](const DistanceSummary& s) {
            return Json{ { "count", s.count }, { "min", s.min }, { "max", s.max }, { "avg", s.mean } };
        };
        Json j;
        j["legit_to_legit"] = summary(legitToLegit);
        j["legit_to_phish"] = summary(legitToPhish);
        j["suggested_threshold"] = suggestedThreshold ? Json(*suggestedThreshold) : Json(nullptr);
        j["separated"] = Separated();
        return j.dump(2);
    }

    ThresholdReport TuneThreshold(const PrototypeStore& store, const NcdMetric& metric) {
        PS_LOG_SCOPE("Builder");
        ThresholdReport report;

        const auto& legit = store.Legitimate();
        std::vector<double> ll;
        for (size_t i = 0; i < legit.size(); ++i) {
            for (size_t j = 0; j < legit.size(); ++j) {
                if (i == j) continue;
                const double d = metric.Distance(legit[i].View(), legit[j].View());
                if (d != 0.0) {
                    ll.push_back(d);
                }
            }
        }

        std::vector<double> lp;
        for (const auto& l : legit) {
            for (const auto& cluster : store.PhishingClusters()) {
                for (const auto& p : cluster.prototypes) {
                    lp.push_back(metric.Distance(l.View(), p.View()));
                }
            }
        }

        report.legitToLegit = DistanceSummary::Of(ll);
        report.legitToPhish = DistanceSummary::Of(lp);
        if (!ll.empty() && !lp.empty()) {
            report.suggestedThreshold = (report.legitToLegit.max + report.legitToPhish.min) / 2.0;
        }

        PS_LOG_INFO("Builder", "L->L: %zu pairs, L->P: %zu pairs", ll.size(), lp.size());
        return report;
    }

} // namespace PhishShape::Prototypes
