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
#include "ClassificationPipeline.hpp"
#include "FeatureExtractor.hpp"
#include "LogisticPredictor.hpp"
#include "ResourceSignature.hpp"
#include "../Utils/Logger.hpp"

#include <stdexcept>

namespace PhishShape::Detection {

    ClassificationPipeline::ClassificationPipeline(std::shared_ptr<const DecisionEngine> engine)
        : m_engine(std::move(engine)) {
        if (!m_engine) {
            throw std::invalid_argument("ClassificationPipeline: engine is null");
        }
    }

    std::unique_ptr<ClassificationPipeline> ClassificationPipeline::FromConfig(const DetectionConfig& config) {
        if (!config.IsValid()) {
            throw std::invalid_argument("ClassificationPipeline: invalid detection config");
        }

        const auto layout = config.strategy == ScoringStrategy::Clustered
            ? Prototypes::StoreLayout::Clustered
            : Prototypes::StoreLayout::Flat;
        auto store = Prototypes::PrototypeStore::LoadFromRoot(config.prototypesDir, layout);

        std::shared_ptr<const DecisionEngine> engine;
        if (config.mlEnabled) {
            using PredictorResult = SignalResult<std::shared_ptr<const IMlPredictor>>;
            const auto model = LogisticPredictor::Load(config.modelPath);
            if (!model) {
                PS_LOG_WARN("Pipeline", "Failed to load ML model: %s", model.Reason().c_str());
            }
            const PredictorResult predictor = model ? PredictorResult::Ok(model.Value())
                                                    : PredictorResult::Unavailable(model.Reason());
            engine = std::make_shared<const DecisionEngine>(std::move(store), config, predictor);
        }
        else {
            engine = std::make_shared<const DecisionEngine>(std::move(store), config);
        }
        return std::make_unique<ClassificationPipeline>(std::move(engine));
    }

    bool ClassificationPipeline::UsesResourceSignature(const Observation& observation, size_t smallDomThreshold) noexcept {
        return observation.sanitizedDom.size() < smallDomThreshold && observation.rawHtml.has_value();
    }

    ClassificationResult ClassificationPipeline::Classify(const Observation& observation) const {
        const size_t domLength = observation.sanitizedDom.size();
        const size_t threshold = m_engine->Config().smallDomThreshold;
        PS_LOG_INFO("Pipeline", "DOM length: %zu bytes", domLength);

        const FeatureMap features = ExtractStructuralFeatures(observation.sanitizedDom);

        ClassificationResult result;
        if (UsesResourceSignature(observation, threshold)) {
            PS_LOG_INFO("Pipeline", "Small DOM detected (%zu < %zu), switching to resource signature mode",
                        domLength, threshold);
            const auto signature = ExtractResourceSignature(*observation.rawHtml, observation.baseUrl);
            PS_LOG_INFO("Pipeline", "Resource signature length: %zu bytes", signature.size());

            result = m_engine->Classify(signature, &features);
            result.detectionMode = std::string(kModeResourceSignature);
            result.resourceSignatureLength = signature.size();
        }
        else {
            if (domLength < threshold) {
                PS_LOG_WARN("Pipeline", "Small DOM (%zu bytes) without raw HTML; using DOM structure", domLength);
            }
            result = m_engine->Classify(observation.sanitizedDom, &features);
            result.detectionMode = std::string(kModeDomStructure);
        }

        result.domLength = domLength;
        result.features = MergeFeatures(features, ExtractNcdFeatures(result.scores));
        return result;
    }

} // namespace PhishShape::Detection
