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
 * PhishShape — phishshape-classify
 * ============================================================================
 *
 * @file Classify.cpp
 * @brief Classify one captured page and print the result as JSON
 *
 * Settings come from the config file and PHISHSHAPE_* variables; flags
 * given on the command line override both.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "ToolSupport.hpp"
#include "../Detection/ClassificationPipeline.hpp"
#include "../Detection/DetectionConfig.hpp"
#include "../Utils/FileUtils.hpp"
#include "../Utils/JSONUtils.hpp"

#include <gflags/gflags.h>

#include <exception>
#include <iostream>
#include <string>

DEFINE_string(dom, "", "Sanitized DOM file to classify (required)");
DEFINE_string(html, "", "Raw HTML of the same page, used for small DOMs");
DEFINE_string(base_url, "", "Page URL for resolving relative resource references");
DEFINE_string(config, "", "Detection config JSON file");
DEFINE_string(prototypes_dir, "", "Prototype root; overrides the config");
DEFINE_string(strategy, "", "flat or clustered; overrides the config");
DEFINE_string(model, "", "Logistic model JSON; enables the ML signal");
DEFINE_bool(verbose, false, "Log at debug level");

namespace {

    using namespace PhishShape;

    bool ApplyFlagOverrides(Detection::DetectionConfig& config) {
        if (!FLAGS_prototypes_dir.empty()) {
            config.prototypesDir = FLAGS_prototypes_dir;
        }
        if (!FLAGS_strategy.empty()) {
            const auto strategy = Detection::ParseStrategy(FLAGS_strategy);
            if (!strategy) {
                PS_LOG_ERROR("Classify", "Unknown strategy '%s'", FLAGS_strategy.c_str());
                return false;
            }
            config.strategy = *strategy;
        }
        if (!FLAGS_model.empty()) {
            config.modelPath = FLAGS_model;
            config.mlEnabled = true;
        }
        return true;
    }

    int Run() {
        if (FLAGS_dom.empty()) {
            PS_LOG_ERROR("Classify", "--dom is required");
            return Tools::kExitUsage;
        }

        Detection::DetectionConfig config;
        Utils::JSON::Error configErr;
        if (!Detection::LoadDetectionConfig(FLAGS_config, config, &configErr)) {
            PS_LOG_ERROR("Classify", "Invalid configuration: %s", configErr.message.c_str());
            return Tools::kExitFailure;
        }
        if (!ApplyFlagOverrides(config)) {
            return Tools::kExitUsage;
        }
        if (!config.IsValid()) {
            PS_LOG_ERROR("Classify", "Invalid configuration after command line overrides");
            return Tools::kExitUsage;
        }

        Detection::Observation observation;
        observation.baseUrl = FLAGS_base_url;

        Utils::FileUtils::Error err;
        if (!Utils::FileUtils::ReadAllBytes(FLAGS_dom, observation.sanitizedDom, &err)) {
            PS_LOG_ERROR("Classify", "Cannot read %s: %s", FLAGS_dom.c_str(), err.message.c_str());
            return Tools::kExitFailure;
        }
        if (!FLAGS_html.empty()) {
            std::string html;
            if (!Utils::FileUtils::ReadAllText(FLAGS_html, html, &err)) {
                PS_LOG_ERROR("Classify", "Cannot read %s: %s", FLAGS_html.c_str(), err.message.c_str());
                return Tools::kExitFailure;
            }
            observation.rawHtml = std::move(html);
        }

        const auto pipeline = Detection::ClassificationPipeline::FromConfig(config);
        const auto result = pipeline->Classify(observation);

        std::cout << result.ToJson().dump(2) << "\n";
        return Tools::kExitOk;
    }

} // anonymous namespace

int main(int argc, char** argv) {
    gflags::SetUsageMessage("Classify a sanitized DOM against the prototype store");
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    PhishShape::Tools::ConsoleLogSession logSession(FLAGS_verbose);
    try {
        return Run();
    }
    catch (const std::exception& ex) {
        PS_LOG_FATAL("Classify", "Unhandled exception: %s", ex.what());
        return PhishShape::Tools::kExitFailure;
    }
}
