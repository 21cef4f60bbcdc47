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
 * PhishShape — Logistic Regression Predictor
 * ============================================================================
 *
 * @file LogisticPredictor.hpp
 * @brief Inference for a standardized logistic model exported as JSON
 *
 * Model file:
 * @code{.json}
 * {
 *   "feature_order": ["total_tag_count", "..."],
 *   "scaler": { "mean": [ ... ], "scale": [ ... ] },
 *   "coefficients": [ ... ],
 *   "intercept": -0.42
 * }
 * @endcode
 *
 * p(phish) = σ(b + Σ wᵢ · (xᵢ − μᵢ) / sᵢ). Missing features read as 0.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "MlPredictor.hpp"
#include "SignalResult.hpp"
#include "../Utils/JSONUtils.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace PhishShape::Detection {

    class LogisticPredictor final : public IMlPredictor {
    public:
        /**
         * @brief Read and validate a model file.
         *
         * @return Unavailable with the reason on a missing file, bad JSON or
         *         mismatched vector lengths
         */
        [[nodiscard]] static SignalResult<std::shared_ptr<const LogisticPredictor>> Load(
            const std::filesystem::path& path);

        [[nodiscard]] static SignalResult<std::shared_ptr<const LogisticPredictor>> FromJson(
            const Utils::JSON::Json& model);

        /// Label "phish" iff p(phish) >= 0.5; probability is that of the label
        [[nodiscard]] MlPrediction Predict(const FeatureMap& features) const override;

        [[nodiscard]] std::string Name() const override { return "logistic_regression"; }

        /// p(phish) before thresholding
        [[nodiscard]] double PhishProbability(const FeatureMap& features) const;

        [[nodiscard]] const std::vector<std::string>& FeatureOrder() const noexcept { return m_featureOrder; }

    private:
        LogisticPredictor() = default;

        std::vector<std::string> m_featureOrder;
        std::vector<double> m_mean;
        std::vector<double> m_scale;
        std::vector<double> m_coefficients;
        double m_intercept = 0.0;
    };

} // namespace PhishShape::Detection
