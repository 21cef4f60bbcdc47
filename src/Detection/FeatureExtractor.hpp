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
 * PhishShape — Feature Extraction
 * ============================================================================
 *
 * @file FeatureExtractor.hpp
 * @brief Numeric features for the supervised predictor
 *
 * Two groups:
 *   - Structural: tag counts, entropy and sizes from the sanitized tag
 *     stream ("html head meta ..." or "div:class input:type ...").
 *   - Similarity: per-cluster and per-class NCD summaries taken from an
 *     already computed ScoreBundle, so no extra compressions are spent.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "MlPredictor.hpp"
#include "ScoreBundle.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PhishShape::Detection {

    /// Per-cluster NCD features cover clusters 1..kFeatureClusterCount
    inline constexpr uint32_t kFeatureClusterCount = 3;

    /// Every feature produced, in model column order
    inline constexpr std::array<std::string_view, 23> kFeatureOrder{
        "total_tag_count",
        "unique_tag_count",
        "count_form",
        "count_input",
        "count_script",
        "count_img",
        "count_iframe",
        "count_link",
        "count_meta",
        "dom_entropy",
        "dom_token_count",
        "dom_length_bytes",
        "ratio_interactive_tags",
        "ncd_phish_cluster_1_min",
        "ncd_phish_cluster_1_avg",
        "ncd_phish_cluster_2_min",
        "ncd_phish_cluster_2_avg",
        "ncd_phish_cluster_3_min",
        "ncd_phish_cluster_3_avg",
        "ncd_legit_min",
        "ncd_legit_avg",
        "ncd_phish_best",
        "ncd_phish_avg"
    };

    /**
     * @brief Tag names of a sanitized stream.
     *
     * Tokens split on ASCII whitespace; "tag:attr" collapses to "tag".
     */
    [[nodiscard]] std::vector<std::string> TagSequence(std::span<const uint8_t> sanitizedDom);

    /// Shannon entropy in bits per character; 0 for empty input
    [[nodiscard]] double ShannonEntropy(std::string_view text) noexcept;

    /**
     * @brief Structural features of a sanitized DOM.
     *
     * Empty input yields all zeros.
     */
    [[nodiscard]] FeatureMap ExtractStructuralFeatures(std::span<const uint8_t> sanitizedDom);

    /**
     * @brief NCD summary features.
     *
     * Clusters 1..3 absent from @p scores read as 1.0. ncd_phish_best and
     * ncd_phish_avg are the min and the mean over those three slots.
     */
    [[nodiscard]] FeatureMap ExtractNcdFeatures(const ScoreBundle& scores);

    /// @p base overlaid with @p extra; keys in @p extra win
    [[nodiscard]] FeatureMap MergeFeatures(FeatureMap base, const FeatureMap& extra);

} // namespace PhishShape::Detection
