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
 * PhishShape — phishshape-build-prototypes
 * ============================================================================
 *
 * @file BuildPrototypes.cpp
 * @brief Select k diverse prototypes per class from a labeled sample pool
 *
 * Reads the .dom samples in samples_dir, labeled by their .meta.json, and writes
 * <output_dir>/phishing and <output_dir>/legitimate.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "ToolSupport.hpp"
#include "../Prototypes/PrototypeBuilder.hpp"
#include "../Similarity/CompressionOracle.hpp"
#include "../Similarity/NcdMetric.hpp"

#include <gflags/gflags.h>

#include <cstdint>
#include <exception>
#include <iostream>

DEFINE_string(samples_dir, "samples", "Directory of labeled .dom samples with .meta.json metadata");
DEFINE_string(output_dir, "prototypes", "Prototype root; phishing/ and legitimate/ are written below it");
DEFINE_int32(k, 5, "Prototypes to select per class");
DEFINE_int64(seed, -1, "Fixed seed for the first FPF pick; negative seeds from the random device");
DEFINE_bool(atypical_seed, false, "Start FPF from the most atypical sample instead of a random one");
DEFINE_int32(workers, 1, "Distance matrix worker threads; 0 uses every hardware thread");
DEFINE_int32(preset, 6, "LZMA preset 0..9");
DEFINE_bool(verbose, false, "Log at debug level");

namespace {

    using namespace PhishShape;

    void PrintClassSummary(const char* name, const Prototypes::ClassBuildSummary& summary) {
        std::cout << name << ": " << summary.writtenFiles.size() << " of " << summary.poolSize
                  << " samples selected\n";
        for (size_t i = 0; i < summary.selectedIds.size() && i < summary.writtenFiles.size(); ++i) {
            std::cout << "  " << summary.writtenFiles[i] << " <- " << summary.selectedIds[i] << "\n";
        }
    }

    int Run() {
        if (FLAGS_k <= 0 || FLAGS_workers < 0 || FLAGS_preset < 0 || FLAGS_preset > 9) {
            PS_LOG_ERROR("BuildPrototypes", "Invalid arguments: k=%d workers=%d preset=%d",
                         FLAGS_k, FLAGS_workers, FLAGS_preset);
            return Tools::kExitUsage;
        }

        Prototypes::BuildOptions options;
        options.k = static_cast<size_t>(FLAGS_k);
        options.matrix.workerCount = static_cast<size_t>(FLAGS_workers);
        if (FLAGS_seed >= 0) {
            options.fpf.randomSeed = static_cast<uint64_t>(FLAGS_seed);
        }
        if (FLAGS_atypical_seed) {
            options.fpf.seedPolicy = Similarity::SeedPolicy::HighestAverageDistance;
        }

        const Similarity::CompressionOracle oracle(static_cast<uint32_t>(FLAGS_preset));
        const Similarity::NcdMetric metric(oracle);

        Prototypes::BuildSummary summary;
        Utils::FileUtils::Error err;
        if (!Prototypes::BuildPrototypes(FLAGS_samples_dir, FLAGS_output_dir, options, metric, summary, &err)) {
            PS_LOG_ERROR("BuildPrototypes", "Build failed: %s", err.message.c_str());
            return Tools::kExitFailure;
        }

        PrintClassSummary("phishing", summary.phishing);
        PrintClassSummary("legitimate", summary.legitimate);
        return Tools::kExitOk;
    }

} // anonymous namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage("Select diverse phishing and legitimate prototypes from a sample pool");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    PhishShape::Tools::ConsoleLogSession logSession(FLAGS_verbose);
    try {
        return Run();
    }
    catch (const std::exception& ex) {
        PS_LOG_FATAL("BuildPrototypes", "Unhandled exception: %s", ex.what());
        return PhishShape::Tools::kExitFailure;
    }
}
