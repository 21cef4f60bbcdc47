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
#include "DetectionConfig.hpp"
#include "../Utils/Logger.hpp"

#include <array>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace PhishShape::Detection {

    using Utils::JSON::Json;

    namespace {

        enum class ValueKind : uint8_t { String, Bool, Count, Real };

        struct KeySpec {
            std::string_view key;
            ValueKind kind;
        };

        constexpr std::array<KeySpec, 12> kKeys{ {
            { "strategy", ValueKind::String },
            { "minimal_input_threshold", ValueKind::Count },
            { "minimal_input_penalty", ValueKind::Real },
            { "high_separation", ValueKind::Real },
            { "low_separation", ValueKind::Real },
            { "small_dom_threshold", ValueKind::Count },
            { "ml_enabled", ValueKind::Bool },
            { "ml_confidence_threshold", ValueKind::Real },
            { "compression_preset", ValueKind::Count },
            { "cache_capacity", ValueKind::Count },
            { "prototypes_dir", ValueKind::String },
            { "model_path", ValueKind::String },
        } };

        void SetError(Utils::JSON::Error* err, std::string message, std::string_view key = {}) {
            if (!err) return;
            err->message = std::move(message);
            if (!key.empty()) {
                err->message += " (key '" + std::string(key) + "')";
            }
        }

        [[nodiscard]] bool CheckKind(const Json& value, ValueKind kind) noexcept {
            switch (kind) {
            case ValueKind::String: return value.is_string();
            case ValueKind::Bool:   return value.is_boolean();
            case ValueKind::Count:  return value.is_number_integer() && value.get<int64_t>() >= 0;
            case ValueKind::Real:   return value.is_number() && std::isfinite(value.get<double>());
            }
            return false;
        }

        [[nodiscard]] bool Assign(DetectionConfig& c, std::string_view key, const Json& v, Utils::JSON::Error* err) {
            if (key == "strategy") {
                const auto s = ParseStrategy(v.get<std::string>());
                if (!s) {
                    SetError(err, "Unknown strategy '" + v.get<std::string>() + "'", key);
                    return false;
                }
                c.strategy = *s;
            }
            else if (key == "minimal_input_threshold") c.minimalInputThreshold = v.get<size_t>();
            else if (key == "minimal_input_penalty")   c.minimalInputPenalty = v.get<double>();
            else if (key == "high_separation")         c.highSeparation = v.get<double>();
            else if (key == "low_separation")          c.lowSeparation = v.get<double>();
            else if (key == "small_dom_threshold")     c.smallDomThreshold = v.get<size_t>();
            else if (key == "ml_enabled")              c.mlEnabled = v.get<bool>();
            else if (key == "ml_confidence_threshold") c.mlConfidenceThreshold = v.get<double>();
            else if (key == "compression_preset") {
                const uint64_t preset = v.get<uint64_t>();
                if (preset > std::numeric_limits<uint32_t>::max()) {
                    SetError(err, "Value out of range", key);
                    return false;
                }
                c.compressionPreset = static_cast<uint32_t>(preset);
            }
            else if (key == "cache_capacity")          c.cacheCapacity = v.get<size_t>();
            else if (key == "prototypes_dir")          c.prototypesDir = v.get<std::string>();
            else if (key == "model_path")              c.modelPath = v.get<std::string>();
            return true;
        }

        [[nodiscard]] std::string EnvName(std::string_view key) {
            std::string name(DetectionDefaults::kEnvPrefix);
            for (char ch : key) {
                name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
            }
            return name;
        }

    } // anonymous namespace

    std::optional<ScoringStrategy> ParseStrategy(std::string_view text) noexcept {
        if (text == "flat") return ScoringStrategy::Flat;
        if (text == "clustered") return ScoringStrategy::Clustered;
        return std::nullopt;
    }

    bool DetectionConfig::IsValid() const noexcept {
        return minimalInputPenalty >= 0.0 &&
               lowSeparation >= 0.0 &&
               highSeparation >= lowSeparation &&
               mlConfidenceThreshold >= 0.0 && mlConfidenceThreshold <= 1.0 &&
               compressionPreset <= 9 &&
               cacheCapacity > 0;
    }

    Json DetectionConfig::ToJson() const {
        return Json{
            { "strategy", StrategyToString(strategy) },
            { "minimal_input_threshold", minimalInputThreshold },
            { "minimal_input_penalty", minimalInputPenalty },
            { "high_separation", highSeparation },
            { "low_separation", lowSeparation },
            { "small_dom_threshold", smallDomThreshold },
            { "ml_enabled", mlEnabled },
            { "ml_confidence_threshold", mlConfidenceThreshold },
            { "compression_preset", compressionPreset },
            { "cache_capacity", cacheCapacity },
            { "prototypes_dir", prototypesDir.string() },
            { "model_path", modelPath.string() }
        };
    }

    EnvLookup ProcessEnvironment() {
        return [](const std::string& name) -> std::optional<std::string> {
            const char* value = std::getenv(name.c_str());
            if (!value) return std::nullopt;
            return std::string(value);
        };
    }

    bool ApplyConfigJson(const Json& j, DetectionConfig& config, Utils::JSON::Error* err) noexcept {
        try {
            if (!j.is_object()) {
                SetError(err, "Configuration root must be an object");
                return false;
            }

            DetectionConfig updated = config;
            for (const auto& spec : kKeys) {
                const auto it = j.find(std::string(spec.key));
                if (it == j.end()) continue;

                if (!CheckKind(*it, spec.kind)) {
                    SetError(err, "Invalid value type", spec.key);
                    return false;
                }
                if (!Assign(updated, spec.key, *it, err)) {
                    return false;
                }
            }

            config = std::move(updated);
            return true;
        }
        catch (const std::exception& e) {
            SetError(err, e.what());
            return false;
        }
    }

    bool ApplyEnvironmentOverrides(DetectionConfig& config, const EnvLookup& lookup, Utils::JSON::Error* err) noexcept {
        try {
            Json overrides = Json::object();
            for (const auto& spec : kKeys) {
                const std::string name = EnvName(spec.key);
                const auto raw = lookup(name);
                if (!raw) continue;

                if (spec.kind == ValueKind::String) {
                    overrides[std::string(spec.key)] = *raw;
                    continue;
                }

                Json value;
                Utils::JSON::Error parseErr;
                if (!Utils::JSON::Parse(*raw, value, &parseErr)) {
                    SetError(err, "Unparsable environment override " + name + "='" + *raw + "'");
                    return false;
                }
                overrides[std::string(spec.key)] = std::move(value);
                PS_LOG_DEBUG("Config", "Environment override %s=%s", name.c_str(), raw->c_str());
            }
            return overrides.empty() || ApplyConfigJson(overrides, config, err);
        }
        catch (const std::exception& e) {
            SetError(err, e.what());
            return false;
        }
    }

    bool LoadDetectionConfig(const std::filesystem::path& path,
                             DetectionConfig& out,
                             Utils::JSON::Error* err,
                             const EnvLookup& lookup) {
        DetectionConfig config;

        if (!path.empty()) {
            Json j;
            if (!Utils::JSON::LoadFromFile(path, j, err)) {
                PS_LOG_ERROR("Config", "Failed to load %s", path.string().c_str());
                return false;
            }
            if (!ApplyConfigJson(j, config, err)) {
                if (err) err->path = path;
                PS_LOG_ERROR("Config", "Invalid configuration in %s", path.string().c_str());
                return false;
            }
        }

        if (lookup && !ApplyEnvironmentOverrides(config, lookup, err)) {
            PS_LOG_ERROR("Config", "Invalid environment override");
            return false;
        }

        if (!config.IsValid()) {
            SetError(err, "Configuration values out of range");
            return false;
        }

        out = std::move(config);
        PS_LOG_INFO("Config", "Detection config: strategy=%s, minimal_input=%zu (+%.2f), small_dom=%zu, ml=%s",
                    StrategyToString(out.strategy), out.minimalInputThreshold, out.minimalInputPenalty,
                    out.smallDomThreshold, out.mlEnabled ? "on" : "off");
        return true;
    }

} // namespace PhishShape::Detection
