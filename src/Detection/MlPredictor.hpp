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
#pragma once

#include <map>
#include <string>

namespace PhishShape::Detection {

    /// Named numeric features; ordered so serialized output is stable
    using FeatureMap = std::map<std::string, double>;

    /**
     * @brief Raw predictor output.
     *
     * Validated by the decision engine: label must be "phish" or "legit"
     * and probability a finite value in [0, 1].
     */
    struct MlPrediction {
        std::string label;
        double probability = 0.0;   ///< Probability of @ref label
    };

    /**
     * @brief Supervised classifier consulted after NCD scoring.
     *
     * Implementations may throw; the engine falls back to the NCD verdict.
     */
    class IMlPredictor {
    public:
        virtual ~IMlPredictor() = default;

        [[nodiscard]] virtual MlPrediction Predict(const FeatureMap& features) const = 0;

        [[nodiscard]] virtual std::string Name() const = 0;
    };

} // namespace PhishShape::Detection
