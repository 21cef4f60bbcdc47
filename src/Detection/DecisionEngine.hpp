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
 * PhishShape — Decision Engine
 * ============================================================================
 *
 * @file DecisionEngine.hpp
 * @brief Prototype scoring, classification policy and ML fusion
 *
 * Per request:
 *   1. NCD from the subject to every prototype (store snapshot)
 *   2. Per-collection minimum and mean, per-cluster in clustered mode
 *   3. Minimal-input penalty on the legitimate side
 *   4. phish iff phish_min < adjusted legit_min; confidence from the gap
 *   5. Optional ML prediction overrides when confident enough
 *
 * Thread Safety:
 *   Classify() is safe to call concurrently. ReplaceStore() swaps the
 *   store atomically; in-flight requests keep their snapshot.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "DetectionConfig.hpp"
#include "MlPredictor.hpp"
#include "ScoreBundle.hpp"
#include "SignalResult.hpp"
#include "../Prototypes/PrototypeStore.hpp"
#include "../Similarity/CompressionOracle.hpp"
#include "../Similarity/NcdMetric.hpp"
#include "../Utils/JSONUtils.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>

namespace PhishShape::Detection {

    enum class Verdict : uint8_t {
        Phish,
        Legit,
        Unknown
    };

    enum class Confidence : uint8_t {
        Low,
        Medium,
        High
    };

    [[nodiscard]] const char* VerdictToString(Verdict v) noexcept;
    [[nodiscard]] const char* ConfidenceToString(Confidence c) noexcept;

    /// "phish"/"legit" only; "unknown" is never a predictor label
    [[nodiscard]] std::optional<Verdict> ParseVerdict(std::string_view text) noexcept;

    /// Source tags
    inline constexpr std::string_view kSourceFlat = "prototype";
    inline constexpr std::string_view kSourceClustered = "ncd-clustered";
    inline constexpr std::string_view kDecisionNcd = "ncd";
    inline constexpr std::string_view kDecisionMl = "ml";
    inline constexpr std::string_view kDecisionNcdFallback = "ncd-fallback";

    /**
     * @brief Outcome of the NCD policy alone.
     */
    struct PolicyDecision {
        Verdict verdict = Verdict::Unknown;
        Confidence confidence = Confidence::Low;
        double legitMinAdjusted = Similarity::kMaxDistance;
        double legitAvgAdjusted = Similarity::kMaxDistance;
        bool minimalInputAdjustment = false;
        double separation = 0.0;                ///< |phish_min − adjusted legit_min|
        std::string finalDecision;
        std::string reason;
    };

    /**
     * @brief Apply penalty, primary rule and confidence tiers to a bundle.
     *
     * Pure function of its inputs.
     */
    [[nodiscard]] PolicyDecision DecidePolicy(const ScoreBundle& scores,
                                              size_t subjectSize,
                                              const DetectionConfig& config);

    /**
     * @brief NCD from @p subject to every prototype in @p store.
     *
     * Flat strategy reports all phishing prototypes as cluster 1. An empty
     * subject gets maximal distances without compressing.
     *
     * @throws Similarity::CompressionError on compressor failure
     */
    [[nodiscard]] ScoreBundle ScoreSubject(std::span<const uint8_t> subject,
                                           const Prototypes::PrototypeStore& store,
                                           ScoringStrategy strategy,
                                           const Similarity::NcdMetric& metric);

    struct ClassificationResult {
        Verdict verdict = Verdict::Unknown;     ///< Final, after ML fusion
        Verdict ncdVerdict = Verdict::Unknown;  ///< NCD policy alone
        Confidence confidence = Confidence::Low;

        ScoreBundle scores;
        double legitMinAdjusted = Similarity::kMaxDistance;
        double legitAvgAdjusted = Similarity::kMaxDistance;
        bool minimalInputAdjustment = false;
        size_t subjectSize = 0;

        ScoringStrategy strategy = ScoringStrategy::Clustered;
        std::string reason;
        std::string finalDecision;
        std::string source;
        std::string decisionSource{ kDecisionNcd };
        std::string mlStatus;
        std::optional<MlPrediction> mlPrediction;

        // Pipeline annotations
        std::string detectionMode;
        std::optional<size_t> domLength;
        std::optional<size_t> resourceSignatureLength;
        FeatureMap features;

        [[nodiscard]] Utils::JSON::Json ToJson() const;
    };

    struct DecisionEngineStatistics {
        std::atomic<uint64_t> totalClassified{ 0 };
        std::atomic<uint64_t> phishVerdicts{ 0 };
        std::atomic<uint64_t> legitVerdicts{ 0 };
        std::atomic<uint64_t> unknownVerdicts{ 0 };
        std::atomic<uint64_t> minimalInputAdjustments{ 0 };
        std::atomic<uint64_t> mlDecisions{ 0 };
        std::atomic<uint64_t> mlFallbacks{ 0 };
        std::atomic<uint64_t> storeReplacements{ 0 };

        void Reset() noexcept;
        [[nodiscard]] std::string ToJson() const;
    };

    class DecisionEngine final {
    public:
        /**
         * @param store     Reference collections; null behaves as empty
         * @param config    Thresholds and strategy, fixed for the engine's life
         * @param predictor Optional ML signal
         * @param oracle    Shared compressor; built from @p config when null
         * @throws std::invalid_argument if @p config is invalid
         */
        DecisionEngine(std::shared_ptr<const Prototypes::PrototypeStore> store,
                       const DetectionConfig& config,
                       std::shared_ptr<const IMlPredictor> predictor = nullptr,
                       std::shared_ptr<const Similarity::CompressionOracle> oracle = nullptr);

        /**
         * @brief Build from the outcome of a model load.
         *
         * An unavailable @p predictor keeps the engine on NCD and every
         * result reports "ncd-fallback" with the load failure reason.
         */
        DecisionEngine(std::shared_ptr<const Prototypes::PrototypeStore> store,
                       const DetectionConfig& config,
                       const SignalResult<std::shared_ptr<const IMlPredictor>>& predictor,
                       std::shared_ptr<const Similarity::CompressionOracle> oracle = nullptr);

        DecisionEngine(const DecisionEngine&) = delete;
        DecisionEngine& operator=(const DecisionEngine&) = delete;

        /**
         * @brief Classify one subject byte sequence.
         *
         * @param features Structural features for the ML signal; NCD
         *                 features are added from the computed scores
         * @throws Similarity::CompressionError on compressor failure
         */
        [[nodiscard]] ClassificationResult Classify(std::span<const uint8_t> subject,
                                                    const FeatureMap* features = nullptr) const;

        /// Swap in a rebuilt store
        void ReplaceStore(std::shared_ptr<const Prototypes::PrototypeStore> store);

        [[nodiscard]] std::shared_ptr<const Prototypes::PrototypeStore> Store() const;

        [[nodiscard]] ScoringStrategy Strategy() const noexcept { return m_config.strategy; }
        [[nodiscard]] const DetectionConfig& Config() const noexcept { return m_config; }
        [[nodiscard]] bool HasPredictor() const noexcept { return m_predictor != nullptr; }
        [[nodiscard]] const Similarity::CompressionOracle& Oracle() const noexcept { return *m_oracle; }
        [[nodiscard]] const DecisionEngineStatistics& Statistics() const noexcept { return m_stats; }
        void ResetStatistics() noexcept { m_stats.Reset(); }

    private:
        void FuseMl(ClassificationResult& result, const FeatureMap* features) const;
        void Record(const ClassificationResult& result) const noexcept;

        DetectionConfig m_config;
        std::shared_ptr<const Similarity::CompressionOracle> m_oracle;
        Similarity::NcdMetric m_metric;
        std::shared_ptr<const IMlPredictor> m_predictor;
        std::string m_predictorUnavailable;     ///< Load failure reason; empty when none was requested

        mutable std::shared_mutex m_storeMutex;
        std::shared_ptr<const Prototypes::PrototypeStore> m_store;

        mutable DecisionEngineStatistics m_stats;
    };

} // namespace PhishShape::Detection
