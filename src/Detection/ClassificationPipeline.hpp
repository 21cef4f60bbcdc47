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
 * PhishShape — Classification Pipeline
 * ============================================================================
 *
 * @file ClassificationPipeline.hpp
 * @brief Chooses the subject representation and annotates the result
 *
 * A sanitized DOM shorter than smallDomThreshold carries too little
 * structure; when the raw HTML is at hand its resource signature is
 * classified instead. Structural features always come from the
 * sanitized DOM.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "DecisionEngine.hpp"
#include "DetectionConfig.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PhishShape::Detection {

    inline constexpr std::string_view kModeDomStructure = "dom-structure";
    inline constexpr std::string_view kModeResourceSignature = "resource-signature";

    /**
     * @brief What the rendering and sanitizing collaborators produced for one page.
     */
    struct Observation {
        std::vector<uint8_t> sanitizedDom;
        std::optional<std::string> rawHtml;     ///< Needed for resource-signature mode
        std::string baseUrl;                    ///< Resolves relative resource URLs
    };

    class ClassificationPipeline final {
    public:
        explicit ClassificationPipeline(std::shared_ptr<const DecisionEngine> engine);

        /**
         * @brief Engine over the store and model named by @p config.
         *
         * The store layout follows the strategy. A model that fails to load
         * is logged and the engine runs NCD-only.
         *
         * @throws std::invalid_argument on an invalid config
         */
        [[nodiscard]] static std::unique_ptr<ClassificationPipeline> FromConfig(const DetectionConfig& config);

        /**
         * @throws Similarity::CompressionError on compressor failure
         */
        [[nodiscard]] ClassificationResult Classify(const Observation& observation) const;

        [[nodiscard]] static bool UsesResourceSignature(const Observation& observation,
                                                        size_t smallDomThreshold) noexcept;

        [[nodiscard]] const DecisionEngine& Engine() const noexcept { return *m_engine; }

    private:
        std::shared_ptr<const DecisionEngine> m_engine;
    };

} // namespace PhishShape::Detection
