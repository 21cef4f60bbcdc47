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
 * PhishShape — phishshape-tune
 * ============================================================================
 *
 * @file TuneThreshold.cpp
 * @brief Report how well the flat prototype sets separate
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "ToolSupport.hpp"
#include "../Prototypes/PrototypeBuilder.hpp"
#include "../Prototypes/PrototypeStore.hpp"
#include "../Similarity/CompressionOracle.hpp"
#include "../Similarity/NcdMetric.hpp"

#include <gflags/gflags.h>

#include <exception>
#include <iomanip>
#include <iostream>

DEFINE_string(prototypes_dir, "prototypes", "Prototype root holding phishing/ and legitimate/");
DEFINE_int32(preset, 6, "LZMA preset 0..9");
DEFINE_bool(verbose, false, "Log at debug level");

namespace {

    using namespace PhishShape;

    void PrintSummary(const char* name, const Prototypes::DistanceSummary& s) {
        std::cout << name << " (" << s.count << " pairs): ";
        if (s.count == 0) {
            std::cout << "n/a\n";
            return;
        }
        std::cout << std::fixed << std::setprecision(4)
                  << "min=" << s.min << " max=" << s.max << " avg=" << s.mean << "\n";
    }

    int Run() {
        if (FLAGS_preset < 0 || FLAGS_preset > 9) {
            PS_LOG_ERROR("Tune", "Invalid preset %d", FLAGS_preset);
            return Tools::kExitUsage;
        }

        const auto store = Prototypes::PrototypeStore::LoadFromRoot(FLAGS_prototypes_dir,
                                                                    Prototypes::StoreLayout::Flat);
        if (!store->HasLegitimate()) {
            PS_LOG_ERROR("Tune", "No legitimate prototypes under %s", FLAGS_prototypes_dir.c_str());
            return Tools::kExitFailure;
        }

        const Similarity::CompressionOracle oracle(static_cast<uint32_t>(FLAGS_preset));
        const Similarity::NcdMetric metric(oracle);
        const auto report = Prototypes::TuneThreshold(*store, metric);

        PrintSummary("legit -> legit", report.legitToLegit);
        PrintSummary("legit -> phish", report.legitToPhish);

        if (!report.suggestedThreshold) {
            std::cout << "No threshold recommendation: one side has no pairs\n";
        }
        else {
            std::cout << std::fixed << std::setprecision(4)
                      << "Suggested threshold: " << *report.suggestedThreshold << "\n";
            if (!report.Separated()) {
                std::cout << "Warning: distributions overlap; prototypes do not separate cleanly\n";
            }
        }
        return Tools::kExitOk;
    }

} // anonymous namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage("Measure legit/phish NCD separation of the flat prototype store");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    PhishShape::Tools::ConsoleLogSession logSession(FLAGS_verbose);
    try {
        return Run();
    }
    catch (const std::exception& ex) {
        PS_LOG_FATAL("Tune", "Unhandled exception: %s", ex.what());
        return PhishShape::Tools::kExitFailure;
    }
}
