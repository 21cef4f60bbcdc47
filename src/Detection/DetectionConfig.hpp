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
 * PhishShape — Detection Configuration
 * ============================================================================
 *
 * @file DetectionConfig.hpp
 * @brief Decision thresholds, compressor settings and resource locations
 *
 * Resolution order: built-in defaults, then a JSON file, then
 * PHISHSHAPE_<KEY> environment variables (key upper-cased).
 *
 * @code{.json}
 * {
 *   "strategy": "clustered",
 *   "minimal_input_threshold": 300,
 *   "minimal_input_penalty": 0.05,
 *   "high_separation": 0.10,
 *   "low_separation": 0.05,
 *   "small_dom_threshold": 2000,
 *   "ml_enabled": false,
 *   "ml_confidence_threshold": 0.6,
 *   "compression_preset": 6,
 *   "cache_capacity": 10000,
 *   "prototypes_dir": "prototypes",
 *   "model_path": "models/phishing_model.json"
 * }
 * @endcode
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "../Utils/JSONUtils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace PhishShape::Detection {

    // ========================================================================
    // DEFAULTS
    // ========================================================================

    namespace DetectionDefaults {
        /// Subjects shorter than this get the minimal-input penalty
        inline constexpr size_t kMinimalInputThreshold = 300;

        /// Added to legitimate distances for minimal subjects
        inline constexpr double kMinimalInputPenalty = 0.05;

        inline constexpr double kHighSeparation = 0.10;
        inline constexpr double kLowSeparation = 0.05;

        /// Sanitized DOMs shorter than this switch to resource-signature mode
        inline constexpr size_t kSmallDomThreshold = 2000;

        /// ML prediction wins at or above this probability
        inline constexpr double kMlConfidenceThreshold = 0.6;

        inline constexpr uint32_t kCompressionPreset = 6;
        inline constexpr size_t kCacheCapacity = 10000;

        inline constexpr std::string_view kPrototypesDir = "prototypes";
        inline constexpr std::string_view kModelPath = "models/phishing_model.json";

        /// Environment variable prefix for overrides
        inline constexpr std::string_view kEnvPrefix = "PHISHSHAPE_";
    }

    enum class ScoringStrategy : uint8_t {
        Flat,       ///< All phishing prototypes scored as one collection
        Clustered   ///< Per-cluster minimum and average
    };

    [[nodiscard]] constexpr const char* StrategyToString(ScoringStrategy s) noexcept {
        return s == ScoringStrategy::Flat ? "flat" : "clustered";
    }

    [[nodiscard]] std::optional<ScoringStrategy> ParseStrategy(std::string_view text) noexcept;

    struct DetectionConfig {
        ScoringStrategy strategy = ScoringStrategy::Clustered;

        size_t minimalInputThreshold = DetectionDefaults::kMinimalInputThreshold;
        double minimalInputPenalty = DetectionDefaults::kMinimalInputPenalty;
        double highSeparation = DetectionDefaults::kHighSeparation;
        double lowSeparation = DetectionDefaults::kLowSeparation;
        size_t smallDomThreshold = DetectionDefaults::kSmallDomThreshold;

        bool mlEnabled = false;
        double mlConfidenceThreshold = DetectionDefaults::kMlConfidenceThreshold;

        uint32_t compressionPreset = DetectionDefaults::kCompressionPreset;
        size_t cacheCapacity = DetectionDefaults::kCacheCapacity;

        std::filesystem::path prototypesDir{ std::string(DetectionDefaults::kPrototypesDir) };
        std::filesystem::path modelPath{ std::string(DetectionDefaults::kModelPath) };

        /**
         * @brief Range checks on every knob.
         *
         * Penalty and separations non-negative, highSeparation >=
         * lowSeparation, ML threshold in [0, 1], preset 0..9, cache > 0.
         */
        [[nodiscard]] bool IsValid() const noexcept;

        [[nodiscard]] static DetectionConfig CreateDefault() noexcept { return DetectionConfig{}; }

        [[nodiscard]] Utils::JSON::Json ToJson() const;
    };

    /// Returns the variable's value, or nullopt when unset
    using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

    /// EnvLookup over the process environment
    [[nodiscard]] EnvLookup ProcessEnvironment();

    /**
     * @brief Overlay keys present in @p j onto @p config.
     *
     * Unknown keys are ignored. A key with the wrong type or an
     * out-of-range value fails the whole call; @p config is left unchanged.
     */
    [[nodiscard]] bool ApplyConfigJson(const Utils::JSON::Json& j,
                                       DetectionConfig& config,
                                       Utils::JSON::Error* err = nullptr) noexcept;

    /**
     * @brief Overlay PHISHSHAPE_<KEY> variables onto @p config.
     *
     * Values are parsed as the JSON scalar the key expects; bare strings
     * are accepted for string-valued keys.
     */
    [[nodiscard]] bool ApplyEnvironmentOverrides(DetectionConfig& config,
                                                 const EnvLookup& lookup,
                                                 Utils::JSON::Error* err = nullptr) noexcept;

    /**
     * @brief Defaults, then @p path (if non-empty), then the environment.
     *
     * @return false on an unreadable file, bad value or an invalid result
     */
    [[nodiscard]] bool LoadDetectionConfig(const std::filesystem::path& path,
                                           DetectionConfig& out,
                                           Utils::JSON::Error* err = nullptr,
                                           const EnvLookup& lookup = ProcessEnvironment());

} // namespace PhishShape::Detection
