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
#include "LogisticPredictor.hpp"
#include "../Utils/Logger.hpp"

#include <cmath>

namespace PhishShape::Detection {

    using Utils::JSON::Json;
    using Result = SignalResult<std::shared_ptr<const LogisticPredictor>>;

    namespace {

        /// Numerically stable logistic
        [[nodiscard]] double Sigmoid(double z) noexcept {
            if (z >= 0.0) {
                return 1.0 / (1.0 + std::exp(-z));
            }
            const double e = std::exp(z);
            return e / (1.0 + e);
        }

    } // anonymous namespace

    Result LogisticPredictor::Load(const std::filesystem::path& path) {
        Json j;
        Utils::JSON::Error err;
        if (!Utils::JSON::LoadFromFile(path, j, &err)) {
            return Result::Unavailable("cannot load model " + path.string() + ": " + err.message);
        }
        auto result = FromJson(j);
        if (result) {
            PS_LOG_INFO("ML", "Logistic model loaded from %s (%zu features)",
                        path.string().c_str(), result.Value()->FeatureOrder().size());
        }
        return result;
    }

    Result LogisticPredictor::FromJson(const Json& model) {
        Utils::JSON::Error err;
        if (!Utils::JSON::RequireKeys(model, "/", { "feature_order", "scaler", "coefficients", "intercept" }, &err)) {
            return Result::Unavailable("malformed model: " + err.message);
        }

        std::shared_ptr<LogisticPredictor> p(new LogisticPredictor());
        if (!Utils::JSON::Get(model, "feature_order", p->m_featureOrder) ||
            !Utils::JSON::Get(model, "scaler.mean", p->m_mean) ||
            !Utils::JSON::Get(model, "scaler.scale", p->m_scale) ||
            !Utils::JSON::Get(model, "coefficients", p->m_coefficients) ||
            !Utils::JSON::Get(model, "intercept", p->m_intercept)) {
            return Result::Unavailable("malformed model: wrong field types");
        }

        const size_t n = p->m_featureOrder.size();
        if (n == 0 || p->m_mean.size() != n || p->m_scale.size() != n || p->m_coefficients.size() != n) {
            return Result::Unavailable("malformed model: vector lengths do not match feature_order");
        }
        for (double& s : p->m_scale) {
            // A constant training feature has scale 0; treat as unit scale
            if (s == 0.0) s = 1.0;
        }
        return Result::Ok(std::move(p));
    }

    double LogisticPredictor::PhishProbability(const FeatureMap& features) const {
        double z = m_intercept;
        for (size_t i = 0; i < m_featureOrder.size(); ++i) {
            const auto it = features.find(m_featureOrder[i]);
            const double x = it != features.end() ? it->second : 0.0;
            z += m_coefficients[i] * ((x - m_mean[i]) / m_scale[i]);
        }
        return Sigmoid(z);
    }

    MlPrediction LogisticPredictor::Predict(const FeatureMap& features) const {
        const double p = PhishProbability(features);
        if (p >= 0.5) {
            return { "phish", p };
        }
        return { "legit", 1.0 - p };
    }

} // namespace PhishShape::Detection
