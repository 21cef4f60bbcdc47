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
 * PhishShape — phishshape-cluster
 * ============================================================================
 *
 * @file ClusterPrototypes.cpp
 * @brief Split the phishing pool into structural families
 *
 * Writes <output_dir>/cluster_<N>/ and prints the cluster analysis. The
 * JSON form of the analysis goes to --report when set.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "ToolSupport.hpp"
#include "../Prototypes/PrototypeBuilder.hpp"
#include "../Prototypes/SampleRepository.hpp"
#include "../Similarity/CompressionOracle.hpp"
#include "../Similarity/NcdMetric.hpp"
#include "../Utils/FileUtils.hpp"

#include <gflags/gflags.h>

#include <exception>
#include <iostream>
#include <vector>

DEFINE_string(phishing_dir, "prototypes/phishing", "Directory of phishing .dom files to cluster");
DEFINE_string(output_dir, "prototypes/phishing_clustered", "Cluster output root; cleared before writing");
DEFINE_int32(max_clusters, 4, "Upper bound on clusters");
DEFINE_int32(min_clusters, 2, "Clusters always created before early stop is considered");
DEFINE_double(epsilon, 0.001, "Minimum variance reduction that justifies another cluster");
DEFINE_int32(workers, 1, "Distance matrix worker threads; 0 uses every hardware thread");
DEFINE_int32(preset, 6, "LZMA preset 0..9");
DEFINE_string(report, "", "Write the cluster analysis as JSON to this file");
DEFINE_bool(verbose, false, "Log at debug level");

namespace {

    using namespace PhishShape;

    int Run() {
        if (FLAGS_max_clusters <= 0 || FLAGS_min_clusters <= 0 || FLAGS_workers < 0 ||
            FLAGS_preset < 0 || FLAGS_preset > 9) {
            PS_LOG_ERROR("Cluster", "Invalid arguments: max_clusters=%d min_clusters=%d workers=%d preset=%d",
                         FLAGS_max_clusters, FLAGS_min_clusters, FLAGS_workers, FLAGS_preset);
            return Tools::kExitUsage;
        }

        Similarity::ClusteringConfig config;
        config.maxClusters = static_cast<size_t>(FLAGS_max_clusters);
        config.minClusters = static_cast<size_t>(FLAGS_min_clusters);
        config.epsilon = FLAGS_epsilon;
        if (!config.IsValid()) {
            PS_LOG_ERROR("Cluster", "Invalid clustering config: need 1 <= min_clusters <= max_clusters and epsilon >= 0");
            return Tools::kExitUsage;
        }

        Similarity::DistanceMatrixOptions matrix;
        matrix.workerCount = static_cast<size_t>(FLAGS_workers);

        std::vector<Prototypes::Sample> pool;
        Utils::FileUtils::Error err;
        if (!Prototypes::LoadSampleDirectory(FLAGS_phishing_dir, Prototypes::Label::Phish, pool, &err)) {
            PS_LOG_ERROR("Cluster", "Cannot read %s: %s", FLAGS_phishing_dir.c_str(), err.message.c_str());
            return Tools::kExitFailure;
        }
        if (pool.empty()) {
            PS_LOG_ERROR("Cluster", "No phishing samples in %s", FLAGS_phishing_dir.c_str());
            return Tools::kExitFailure;
        }

        const Similarity::CompressionOracle oracle(static_cast<uint32_t>(FLAGS_preset));
        const Similarity::NcdMetric metric(oracle);

        Prototypes::ClusterAnalysis analysis;
        if (!Prototypes::ClusterPhishingPool(pool, FLAGS_output_dir, config, matrix, metric, analysis, &err)) {
            PS_LOG_ERROR("Cluster", "Clustering failed: %s", err.message.c_str());
            return Tools::kExitFailure;
        }

        std::cout << analysis.ToText();

        if (!FLAGS_report.empty()) {
            const std::string json = analysis.ToJson();
            if (!Utils::FileUtils::WriteAllBytesAtomic(FLAGS_report, json.data(), json.size(), &err)) {
                PS_LOG_ERROR("Cluster", "Cannot write report %s: %s", FLAGS_report.c_str(), err.message.c_str());
                return Tools::kExitFailure;
            }
            PS_LOG_INFO("Cluster", "Report written to %s", FLAGS_report.c_str());
        }
        return Tools::kExitOk;
    }

} // anonymous namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage("Cluster phishing samples by structural NCD");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    PhishShape::Tools::ConsoleLogSession logSession(FLAGS_verbose);
    try {
        return Run();
    }
    catch (const std::exception& ex) {
        PS_LOG_FATAL("Cluster", "Unhandled exception: %s", ex.what());
        return PhishShape::Tools::kExitFailure;
    }
}
