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
#include "FeatureExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace PhishShape::Detection {

    namespace {

        [[nodiscard]] bool IsSpace(uint8_t c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        [[nodiscard]] std::string ClusterKey(uint32_t id, const char* stat) {
            return "ncd_phish_cluster_" + std::to_string(id) + "_" + stat;
        }

    } // anonymous namespace

    std::vector<std::string> TagSequence(std::span<const uint8_t> sanitizedDom) {
        std::vector<std::string> tags;
        size_t i = 0;
        while (i < sanitizedDom.size()) {
            while (i < sanitizedDom.size() && IsSpace(sanitizedDom[i])) ++i;
            const size_t start = i;
            while (i < sanitizedDom.size() && !IsSpace(sanitizedDom[i])) ++i;
            if (i == start) break;

            std::string token(reinterpret_cast<const char*>(sanitizedDom.data() + start), i - start);
            const auto colon = token.find(':');
            if (colon != std::string::npos) {
                token.resize(colon);
            }
            if (!token.empty()) {
                tags.push_back(std::move(token));
            }
        }
        return tags;
    }

    double ShannonEntropy(std::string_view text) noexcept {
        if (text.empty()) return 0.0;

        size_t freqs[256] = {};
        for (unsigned char c : text) freqs[c]++;

        double entropy = 0.0;
        const double len = static_cast<double>(text.size());
        for (size_t count : freqs) {
            if (count == 0) continue;
            const double p = static_cast<double>(count) / len;
            entropy -= p * std::log2(p);
        }
        return entropy;
    }

    FeatureMap ExtractStructuralFeatures(std::span<const uint8_t> sanitizedDom) {
        const auto tags = TagSequence(sanitizedDom);

        std::unordered_map<std::string, size_t> counts;
        std::string joined;
        for (const auto& tag : tags) {
            counts[tag]++;
            if (!joined.empty()) joined += ' ';
            joined += tag;
        }

        const auto count = [&](const char* name) -> double {
            const auto it = counts.find(name);
            return it == counts.end() ? 0.0 : static_cast<double>(it->second);
        };

        const double total = static_cast<double>(tags.size());
        const double interactive = count("form") + count("input") + count("button");

        FeatureMap f;
        f["total_tag_count"] = total;
        f["unique_tag_count"] = static_cast<double>(counts.size());
        f["count_form"] = count("form");
        f["count_input"] = count("input");
        f["count_script"] = count("script");
        f["count_img"] = count("img");
        f["count_iframe"] = count("iframe");
        f["count_link"] = count("link");
        f["count_meta"] = count("meta");
        f["dom_entropy"] = ShannonEntropy(joined);
        f["dom_token_count"] = total;
        f["dom_length_bytes"] = static_cast<double>(sanitizedDom.size());
        f["ratio_interactive_tags"] = tags.empty() ? 0.0 : interactive / total;
        return f;
    }

    FeatureMap ExtractNcdFeatures(const ScoreBundle& scores) {
        FeatureMap f;
        double best = std::numeric_limits<double>::infinity();
        double avgSum = 0.0;

        for (uint32_t id = 1; id <= kFeatureClusterCount; ++id) {
            double mn = Similarity::kMaxDistance;
            double av = Similarity::kMaxDistance;
            const auto it = std::find_if(scores.clusters.begin(), scores.clusters.end(),
                                         [id](const ClusterScore& c) { return c.clusterId == id; });
            if (it != scores.clusters.end() && it->count > 0) {
                mn = it->min;
                av = it->avg;
            }
            f[ClusterKey(id, "min")] = mn;
            f[ClusterKey(id, "avg")] = av;
            best = std::min(best, mn);
            avgSum += av;
        }

        f["ncd_legit_min"] = scores.legitMin;
        f["ncd_legit_avg"] = scores.legitAvg;
        f["ncd_phish_best"] = best;
        f["ncd_phish_avg"] = avgSum / static_cast<double>(kFeatureClusterCount);
        return f;
    }

    FeatureMap MergeFeatures(FeatureMap base, const FeatureMap& extra) {
        for (const auto& [name, value] : extra) {
            base[name] = value;
        }
        return base;
    }

} // namespace PhishShape::Detection
