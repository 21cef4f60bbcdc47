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
#include "DecisionEngine.hpp"
#include "FeatureExtractor.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace PhishShape::Detection {

    using Prototypes::Prototype;
    using Prototypes::PrototypeStore;
    using Similarity::kMaxDistance;
    using Utils::JSON::Json;

    namespace {

        [[nodiscard]] std::string Format(const char* fmt, ...) {
            char buf[512];
            va_list args;
            va_start(args, fmt);
            const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
            va_end(args);
            if (n < 0) return {};
            return std::string(buf, std::min(static_cast<size_t>(n), sizeof(buf) - 1));
        }

        [[nodiscard]] double Round4(double v) noexcept {
            return std::round(v * 10000.0) / 10000.0;
        }

        [[nodiscard]] const DetectionConfig& Validated(const DetectionConfig& config) {
            if (!config.IsValid()) {
                throw std::invalid_argument("DecisionEngine: invalid detection config");
            }
            return config;
        }

        /// Accumulate min, sum and count of distances from @p subject to @p prototypes
        void ScoreCollection(std::span<const uint8_t> subject,
                             const std::vector<Prototype>& prototypes,
                             const Similarity::NcdMetric& metric,
                             double& minOut, double& sumOut, size_t& countOut) {
            for (const auto& p : prototypes) {
                const double d = subject.empty() ? kMaxDistance : metric.Distance(subject, p.View());
                minOut = std::min(minOut, d);
                sumOut += d;
                ++countOut;
            }
        }

        const std::shared_ptr<const PrototypeStore>& EmptyStore() {
            static const auto empty = std::make_shared<const PrototypeStore>();
            return empty;
        }

        [[nodiscard]] std::string ValidatePrediction(const MlPrediction& p) {
            if (!ParseVerdict(p.label)) {
                return "malformed prediction: label '" + p.label + "'";
            }
            if (!std::isfinite(p.probability) || p.probability < 0.0 || p.probability > 1.0) {
                return "malformed prediction: probability out of range";
            }
            return {};
        }

    } // anonymous namespace

    const char* VerdictToString(Verdict v) noexcept {
        switch (v) {
        case Verdict::Phish: return "phish";
        case Verdict::Legit: return "legit";
        case Verdict::Unknown: return "unknown";
        }
        return "unknown";
    }

    const char* ConfidenceToString(Confidence c) noexcept {
        switch (c) {
        case Confidence::Low: return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High: return "high";
        }
        return "low";
    }

    std::optional<Verdict> ParseVerdict(std::string_view text) noexcept {
        if (text == "phish") return Verdict::Phish;
        if (text == "legit") return Verdict::Legit;
        return std::nullopt;
    }

    // ========================================================================
    // Policy
    // ========================================================================

    PolicyDecision DecidePolicy(const ScoreBundle& scores, size_t subjectSize, const DetectionConfig& config) {
        PolicyDecision d;
        d.legitMinAdjusted = scores.legitMin;
        d.legitAvgAdjusted = scores.legitAvg;

        if (!scores.HasPhishing() || !scores.HasLegitimate()) {
            const bool both = !scores.HasPhishing() && !scores.HasLegitimate();
            const char* missing = both ? "phishing and legitimate classes"
                                : (!scores.HasPhishing() ? "phishing class" : "legitimate class");
            d.verdict = Verdict::Unknown;
            d.confidence = Confidence::Low;
            d.finalDecision = std::string("No prototypes available for ") + missing;
            d.reason = "Classified as unknown. " + d.finalDecision + ". Build prototypes before classifying.";
            return d;
        }

        if (subjectSize < config.minimalInputThreshold) {
            d.minimalInputAdjustment = true;
            d.legitMinAdjusted = scores.legitMin + config.minimalInputPenalty;
            d.legitAvgAdjusted = scores.legitAvg + config.minimalInputPenalty;
        }

        const double phishMin = scores.phishMin;
        if (phishMin < d.legitMinAdjusted) {
            d.verdict = Verdict::Phish;
            d.finalDecision = d.minimalInputAdjustment
                ? Format("Phishing prototype match (%.4f) better than adjusted legitimate (%.4f, original: %.4f)",
                         phishMin, d.legitMinAdjusted, scores.legitMin)
                : Format("Phishing prototype match (%.4f) better than legitimate (%.4f)", phishMin, scores.legitMin);
        }
        else {
            d.verdict = Verdict::Legit;
            d.finalDecision = d.minimalInputAdjustment
                ? Format("Legitimate prototype match (%.4f, original: %.4f) better than phishing (%.4f)",
                         d.legitMinAdjusted, scores.legitMin, phishMin)
                : Format("Legitimate prototype match (%.4f) better than phishing (%.4f)", scores.legitMin, phishMin);
        }

        d.separation = std::fabs(phishMin - d.legitMinAdjusted);
        if (d.separation > config.highSeparation) {
            d.confidence = Confidence::High;
        }
        else if (d.separation > config.lowSeparation) {
            d.confidence = Confidence::Medium;
        }
        else {
            d.confidence = Confidence::Low;
        }

        d.reason = Format("Classified as %s. Phishing prototype distances: min=%.4f, avg=%.4f. "
                          "Legitimate prototype distances: min=%.4f, avg=%.4f. ",
                          VerdictToString(d.verdict), scores.phishMin, scores.phishAvg,
                          scores.legitMin, scores.legitAvg);
        if (d.minimalInputAdjustment) {
            d.reason += Format("Minimal DOM penalty applied (+%g). ", config.minimalInputPenalty);
        }
        d.reason += d.finalDecision;
        return d;
    }

    // ========================================================================
    // Scoring
    // ========================================================================

    ScoreBundle ScoreSubject(std::span<const uint8_t> subject,
                             const PrototypeStore& store,
                             ScoringStrategy strategy,
                             const Similarity::NcdMetric& metric) {
        ScoreBundle b;

        if (store.HasLegitimate()) {
            double mn = std::numeric_limits<double>::max();
            double sum = 0.0;
            ScoreCollection(subject, store.Legitimate(), metric, mn, sum, b.legitCount);
            b.legitMin = mn;
            b.legitAvg = sum / static_cast<double>(b.legitCount);
        }

        double phishSum = 0.0;
        if (strategy == ScoringStrategy::Flat) {
            ClusterScore all;
            all.clusterId = 1;
            double mn = std::numeric_limits<double>::max();
            double sum = 0.0;
            for (const auto& cluster : store.PhishingClusters()) {
                ScoreCollection(subject, cluster.prototypes, metric, mn, sum, all.count);
            }
            if (all.count > 0) {
                all.min = mn;
                all.avg = sum / static_cast<double>(all.count);
                b.clusters.push_back(all);
            }
            phishSum = sum;
        }
        else {
            for (const auto& cluster : store.PhishingClusters()) {
                ClusterScore cs;
                cs.clusterId = cluster.id;
                double mn = std::numeric_limits<double>::max();
                double sum = 0.0;
                ScoreCollection(subject, cluster.prototypes, metric, mn, sum, cs.count);
                if (cs.count == 0) continue;
                cs.min = mn;
                cs.avg = sum / static_cast<double>(cs.count);
                phishSum += sum;
                b.clusters.push_back(cs);
            }
        }

        for (const auto& cs : b.clusters) {
            b.phishCount += cs.count;
            // Strict < keeps the lowest cluster on ties
            if (!b.bestCluster || cs.min < b.phishMin) {
                b.phishMin = cs.min;
                b.bestCluster = cs.clusterId;
            }
        }
        if (b.phishCount > 0) {
            b.phishAvg = phishSum / static_cast<double>(b.phishCount);
        }
        return b;
    }

    // ========================================================================
    // Result and statistics
    // ========================================================================

    Json ClassificationResult::ToJson() const {
        Json j;
        j["verdict"] = VerdictToString(verdict);
        j["ncd_verdict"] = VerdictToString(ncdVerdict);
        j["phish_min"] = Round4(scores.phishMin);
        j["phish_avg"] = Round4(scores.phishAvg);
        j["legit_min"] = Round4(scores.legitMin);
        j["legit_avg"] = Round4(scores.legitAvg);
        j["legit_min_adjusted"] = Round4(legitMinAdjusted);
        j["legit_avg_adjusted"] = Round4(legitAvgAdjusted);

        if (strategy == ScoringStrategy::Clustered) {
            j["best_cluster"] = scores.bestCluster ? Json(*scores.bestCluster) : Json(nullptr);
            Json clusters = Json::array();
            for (const auto& c : scores.clusters) {
                clusters.push_back({
                    { "cluster", c.clusterId },
                    { "min", Round4(c.min) },
                    { "avg", Round4(c.avg) },
                    { "count", c.count }
                });
            }
            j["cluster_scores"] = std::move(clusters);
        }

        j["dom_size"] = subjectSize;
        j["minimal_dom_adjustment_applied"] = minimalInputAdjustment;
        j["confidence"] = ConfidenceToString(confidence);
        j["reason"] = reason;
        j["final_decision"] = finalDecision;
        j["source"] = source;
        j["decision_source"] = decisionSource;
        j["ml_status"] = mlStatus;
        if (mlPrediction) {
            j["ml_prediction"] = { { "label", mlPrediction->label }, { "probability", mlPrediction->probability } };
        }

        if (!detectionMode.empty()) j["detection_mode"] = detectionMode;
        if (domLength) j["dom_length"] = *domLength;
        if (resourceSignatureLength) j["resource_sig_length"] = *resourceSignatureLength;
        if (!features.empty()) j["features"] = features;
        return j;
    }

    void DecisionEngineStatistics::Reset() noexcept {
        totalClassified.store(0, std::memory_order_relaxed);
        phishVerdicts.store(0, std::memory_order_relaxed);
        legitVerdicts.store(0, std::memory_order_relaxed);
        unknownVerdicts.store(0, std::memory_order_relaxed);
        minimalInputAdjustments.store(0, std::memory_order_relaxed);
        mlDecisions.store(0, std::memory_order_relaxed);
        mlFallbacks.store(0, std::memory_order_relaxed);
        storeReplacements.store(0, std::memory_order_relaxed);
    }

    std::string DecisionEngineStatistics::ToJson() const {
        const Json j{
            { "total_classified", totalClassified.load(std::memory_order_relaxed) },
            { "phish", phishVerdicts.load(std::memory_order_relaxed) },
            { "legit", legitVerdicts.load(std::memory_order_relaxed) },
            { "unknown", unknownVerdicts.load(std::memory_order_relaxed) },
            { "minimal_input_adjustments", minimalInputAdjustments.load(std::memory_order_relaxed) },
            { "ml_decisions", mlDecisions.load(std::memory_order_relaxed) },
            { "ml_fallbacks", mlFallbacks.load(std::memory_order_relaxed) },
            { "store_replacements", storeReplacements.load(std::memory_order_relaxed) }
        };
        return j.dump();
    }

    // ========================================================================
    // Engine
    // ========================================================================

    DecisionEngine::DecisionEngine(std::shared_ptr<const PrototypeStore> store,
                                   const DetectionConfig& config,
                                   std::shared_ptr<const IMlPredictor> predictor,
                                   std::shared_ptr<const Similarity::CompressionOracle> oracle)
        : m_config(Validated(config))
        , m_oracle(oracle ? std::move(oracle)
                          : std::make_shared<const Similarity::CompressionOracle>(config.compressionPreset,
                                                                                  config.cacheCapacity))
        , m_metric(*m_oracle)
        , m_predictor(std::move(predictor))
        , m_store(store ? std::move(store) : EmptyStore()) {
        PS_LOG_INFO("Engine", "Decision engine ready: strategy=%s, %zu phishing in %zu clusters, %zu legit, ml=%s",
                    StrategyToString(m_config.strategy), m_store->PhishingCount(), m_store->ClusterCount(),
                    m_store->LegitimateCount(), m_predictor ? m_predictor->Name().c_str() : "none");
    }

    DecisionEngine::DecisionEngine(std::shared_ptr<const PrototypeStore> store,
                                   const DetectionConfig& config,
                                   const SignalResult<std::shared_ptr<const IMlPredictor>>& predictor,
                                   std::shared_ptr<const Similarity::CompressionOracle> oracle)
        : DecisionEngine(std::move(store), config,
                         predictor ? predictor.Value() : std::shared_ptr<const IMlPredictor>(),
                         std::move(oracle)) {
        if (!predictor) {
            m_predictorUnavailable = predictor.Reason().empty() ? std::string("model not loaded") : predictor.Reason();
            PS_LOG_WARN("Engine", "ML predictor unavailable: %s. Falling back to NCD-only mode.",
                        m_predictorUnavailable.c_str());
        }
    }

    std::shared_ptr<const PrototypeStore> DecisionEngine::Store() const {
        std::shared_lock lock(m_storeMutex);
        return m_store;
    }

    void DecisionEngine::ReplaceStore(std::shared_ptr<const PrototypeStore> store) {
        if (!store) store = EmptyStore();
        {
            std::unique_lock lock(m_storeMutex);
            m_store.swap(store);
        }
        m_stats.storeReplacements.fetch_add(1, std::memory_order_relaxed);
        PS_LOG_INFO("Engine", "Prototype store replaced");
    }

    ClassificationResult DecisionEngine::Classify(std::span<const uint8_t> subject, const FeatureMap* features) const {
        const auto store = Store();

        ClassificationResult r;
        r.strategy = m_config.strategy;
        r.source = std::string(m_config.strategy == ScoringStrategy::Flat ? kSourceFlat : kSourceClustered);
        r.subjectSize = subject.size();
        r.scores = ScoreSubject(subject, *store, m_config.strategy, m_metric);

        PolicyDecision d = DecidePolicy(r.scores, subject.size(), m_config);
        r.verdict = d.verdict;
        r.ncdVerdict = d.verdict;
        r.confidence = d.confidence;
        r.legitMinAdjusted = d.legitMinAdjusted;
        r.legitAvgAdjusted = d.legitAvgAdjusted;
        r.minimalInputAdjustment = d.minimalInputAdjustment;
        r.finalDecision = std::move(d.finalDecision);
        r.reason = std::move(d.reason);

        if (subject.empty()) {
            r.reason += " Empty subject: all distances set to maximum.";
        }
        if (m_config.strategy == ScoringStrategy::Clustered && r.scores.bestCluster) {
            r.reason += Format(" Closest phishing cluster: %u.", *r.scores.bestCluster);
        }

        if (d.minimalInputAdjustment) {
            PS_LOG_INFO("Engine", "Minimal input detected (%zu bytes < %zu). Applying penalty: +%g to legitimate scores",
                        subject.size(), m_config.minimalInputThreshold, m_config.minimalInputPenalty);
        }

        FuseMl(r, features);
        Record(r);

        PS_LOG_INFO("Engine", "Classification: %s (ncd=%s, phish_min=%.4f, legit_min=%.4f, legit_min_adj=%.4f, "
                              "diff=%.4f, source=%s)",
                    VerdictToString(r.verdict), VerdictToString(r.ncdVerdict), r.scores.phishMin,
                    r.scores.legitMin, r.legitMinAdjusted, d.separation, r.decisionSource.c_str());
        return r;
    }

    void DecisionEngine::FuseMl(ClassificationResult& r, const FeatureMap* features) const {
        if (!m_predictor) {
            if (m_predictorUnavailable.empty()) {
                r.decisionSource = std::string(kDecisionNcd);
                r.mlStatus = "unavailable: no predictor configured";
            }
            else {
                r.decisionSource = std::string(kDecisionNcdFallback);
                r.mlStatus = "unavailable: " + m_predictorUnavailable;
            }
            return;
        }

        const FeatureMap mlFeatures = MergeFeatures(features ? *features : FeatureMap{}, ExtractNcdFeatures(r.scores));

        MlPrediction prediction;
        try {
            prediction = m_predictor->Predict(mlFeatures);
        }
        catch (const std::exception& e) {
            PS_LOG_ERROR("Engine", "ML prediction failed: %s. Using NCD result only.", e.what());
            r.decisionSource = std::string(kDecisionNcdFallback);
            r.mlStatus = std::string("error: ") + e.what();
            return;
        }

        if (const std::string problem = ValidatePrediction(prediction); !problem.empty()) {
            PS_LOG_ERROR("Engine", "ML %s. Using NCD result only.", problem.c_str());
            r.decisionSource = std::string(kDecisionNcdFallback);
            r.mlStatus = "error: " + problem;
            return;
        }

        r.mlPrediction = prediction;
        if (prediction.probability >= m_config.mlConfidenceThreshold) {
            PS_LOG_INFO("Engine", "ML prediction: %s (confidence: %.4f) - Using ML result",
                        prediction.label.c_str(), prediction.probability);
            r.verdict = *ParseVerdict(prediction.label);
            r.decisionSource = std::string(kDecisionMl);
            r.mlStatus = "ok";
        }
        else {
            PS_LOG_INFO("Engine", "ML prediction: %s (confidence: %.4f) - Using NCD result (low confidence)",
                        prediction.label.c_str(), prediction.probability);
            r.decisionSource = std::string(kDecisionNcd);
            r.mlStatus = "ok: below confidence threshold";
        }
    }

    void DecisionEngine::Record(const ClassificationResult& r) const noexcept {
        m_stats.totalClassified.fetch_add(1, std::memory_order_relaxed);
        switch (r.verdict) {
        case Verdict::Phish: m_stats.phishVerdicts.fetch_add(1, std::memory_order_relaxed); break;
        case Verdict::Legit: m_stats.legitVerdicts.fetch_add(1, std::memory_order_relaxed); break;
        case Verdict::Unknown: m_stats.unknownVerdicts.fetch_add(1, std::memory_order_relaxed); break;
        }
        if (r.minimalInputAdjustment) m_stats.minimalInputAdjustments.fetch_add(1, std::memory_order_relaxed);
        if (r.decisionSource == kDecisionMl) m_stats.mlDecisions.fetch_add(1, std::memory_order_relaxed);
        if (r.decisionSource == kDecisionNcdFallback) m_stats.mlFallbacks.fetch_add(1, std::memory_order_relaxed);
    }

} // namespace PhishShape::Detection
