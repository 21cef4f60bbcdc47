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
#include <gtest/gtest.h>
#include "../../../src/Detection/FeatureExtractor.hpp"

#include <cmath>
#include <set>
#include <string>
#include <vector>

using namespace PhishShape::Detection;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class FeatureExtractorTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> Bytes(const std::string& s) {
        return { s.begin(), s.end() };
    }

    static ScoreBundle SampleScores() {
        ScoreBundle s;
        s.clusters = {
            ClusterScore{ 1, 0.3, 0.5, 2 },
            ClusterScore{ 3, 0.2, 0.6, 1 }
        };
        s.phishMin = 0.2;
        s.legitMin = 0.4;
        s.legitAvg = 0.7;
        s.phishCount = 3;
        s.legitCount = 2;
        return s;
    }
};

// ============================================================================
// TAG SEQUENCE
// ============================================================================
TEST_F(FeatureExtractorTest, TagSequence_CollapsesAttributeTokens) {
    const auto tags = TagSequence(Bytes("html body\tform:action input:type:password\n input  button"));
    EXPECT_EQ(tags, (std::vector<std::string>{ "html", "body", "form", "input", "input", "button" }));
}

TEST_F(FeatureExtractorTest, TagSequence_EmptyOrBlank_NoTags) {
    EXPECT_TRUE(TagSequence({}).empty());
    EXPECT_TRUE(TagSequence(Bytes("  \n\t ")).empty());
}

TEST_F(FeatureExtractorTest, TagSequence_LeadingColonToken_Dropped) {
    EXPECT_EQ(TagSequence(Bytes(":orphan div")), (std::vector<std::string>{ "div" }));
}

// ============================================================================
// ENTROPY
// ============================================================================
TEST_F(FeatureExtractorTest, ShannonEntropy_KnownValues) {
    EXPECT_DOUBLE_EQ(ShannonEntropy(""), 0.0);
    EXPECT_DOUBLE_EQ(ShannonEntropy("aaaa"), 0.0);
    EXPECT_DOUBLE_EQ(ShannonEntropy("aabb"), 1.0);
    EXPECT_DOUBLE_EQ(ShannonEntropy("abcd"), 2.0);
}

// ============================================================================
// STRUCTURAL FEATURES
// ============================================================================
TEST_F(FeatureExtractorTest, ExtractStructuralFeatures_CountsTags) {
    const auto dom = Bytes("html body form input:type input:name button script img img iframe link meta");
    const auto f = ExtractStructuralFeatures(dom);

    EXPECT_DOUBLE_EQ(f.at("total_tag_count"), 12.0);
    EXPECT_DOUBLE_EQ(f.at("unique_tag_count"), 10.0);
    EXPECT_DOUBLE_EQ(f.at("count_form"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("count_input"), 2.0);
    EXPECT_DOUBLE_EQ(f.at("count_script"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("count_img"), 2.0);
    EXPECT_DOUBLE_EQ(f.at("count_iframe"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("count_link"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("count_meta"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("dom_token_count"), 12.0);
    EXPECT_DOUBLE_EQ(f.at("dom_length_bytes"), static_cast<double>(dom.size()));
    EXPECT_DOUBLE_EQ(f.at("ratio_interactive_tags"), 4.0 / 12.0);
    EXPECT_DOUBLE_EQ(f.at("dom_entropy"),
                     ShannonEntropy("html body form input input button script img img iframe link meta"));
}

TEST_F(FeatureExtractorTest, ExtractStructuralFeatures_EmptyDom_AllZero) {
    const auto f = ExtractStructuralFeatures({});
    EXPECT_DOUBLE_EQ(f.at("total_tag_count"), 0.0);
    EXPECT_DOUBLE_EQ(f.at("ratio_interactive_tags"), 0.0);
    EXPECT_DOUBLE_EQ(f.at("dom_entropy"), 0.0);
}

// ============================================================================
// NCD FEATURES
// ============================================================================
TEST_F(FeatureExtractorTest, ExtractNcdFeatures_MissingClusterReadsAsMaximal) {
    const auto f = ExtractNcdFeatures(SampleScores());

    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_1_min"), 0.3);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_1_avg"), 0.5);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_2_min"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_2_avg"), 1.0);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_3_min"), 0.2);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_3_avg"), 0.6);
    EXPECT_DOUBLE_EQ(f.at("ncd_legit_min"), 0.4);
    EXPECT_DOUBLE_EQ(f.at("ncd_legit_avg"), 0.7);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_best"), 0.2);
    EXPECT_NEAR(f.at("ncd_phish_avg"), (0.5 + 1.0 + 0.6) / 3.0, 1e-12);
}

TEST_F(FeatureExtractorTest, ExtractNcdFeatures_ClustersBeyondThree_Ignored) {
    ScoreBundle s;
    s.clusters = { ClusterScore{ 4, 0.05, 0.1, 1 } };
    const auto f = ExtractNcdFeatures(s);

    EXPECT_DOUBLE_EQ(f.at("ncd_phish_best"), 1.0);
    EXPECT_EQ(f.count("ncd_phish_cluster_4_min"), 0u);
}

TEST_F(FeatureExtractorTest, ExtractNcdFeatures_DistancesAboveOne_BestIsPlainMinimum) {
    ScoreBundle s;
    s.clusters = { ClusterScore{ 1, 1.05, 1.07, 2 },
                   ClusterScore{ 2, 1.08, 1.09, 1 },
                   ClusterScore{ 3, 1.06, 1.06, 1 } };
    const auto f = ExtractNcdFeatures(s);

    EXPECT_DOUBLE_EQ(f.at("ncd_phish_best"), 1.05);
    EXPECT_DOUBLE_EQ(f.at("ncd_phish_cluster_2_min"), 1.08);
    EXPECT_NEAR(f.at("ncd_phish_avg"), (1.07 + 1.09 + 1.06) / 3.0, 1e-12);
}

TEST_F(FeatureExtractorTest, AllFeatures_MatchPublishedOrder) {
    const auto merged = MergeFeatures(ExtractStructuralFeatures(Bytes("html body")),
                                      ExtractNcdFeatures(SampleScores()));

    std::set<std::string> produced;
    for (const auto& [name, value] : merged) produced.insert(name);

    std::set<std::string> published;
    for (auto name : kFeatureOrder) published.insert(std::string(name));

    EXPECT_EQ(produced, published);
}

TEST_F(FeatureExtractorTest, MergeFeatures_ExtraWins) {
    const FeatureMap base{ { "a", 1.0 }, { "b", 2.0 } };
    const FeatureMap extra{ { "b", 5.0 }, { "c", 3.0 } };

    const auto merged = MergeFeatures(base, extra);
    EXPECT_EQ(merged.size(), 3u);
    EXPECT_DOUBLE_EQ(merged.at("b"), 5.0);
}
