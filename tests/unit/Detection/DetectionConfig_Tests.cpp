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
#include "../../../src/Detection/DetectionConfig.hpp"
#include "../../../src/Utils/FileUtils.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <random>
#include <string>

using namespace PhishShape;
using namespace PhishShape::Detection;
namespace fs = std::filesystem;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class DetectionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        testDir = fs::temp_directory_path() / ("phishshape_config_" + std::to_string(rd()));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    EnvLookup FakeEnvironment() const {
        return [this](const std::string& name) -> std::optional<std::string> {
            const auto it = env.find(name);
            if (it == env.end()) return std::nullopt;
            return it->second;
        };
    }

    fs::path WriteConfig(const std::string& text) {
        const auto path = testDir / "phishshape.json";
        EXPECT_TRUE(Utils::FileUtils::WriteAllBytes(path, text.data(), text.size()));
        return path;
    }

    std::map<std::string, std::string> env;
    fs::path testDir;
};

// ============================================================================
// DEFAULTS
// ============================================================================
TEST_F(DetectionConfigTest, CreateDefault_MatchesDocumentedDefaults) {
    const auto c = DetectionConfig::CreateDefault();

    EXPECT_EQ(c.strategy, ScoringStrategy::Clustered);
    EXPECT_EQ(c.minimalInputThreshold, 300u);
    EXPECT_DOUBLE_EQ(c.minimalInputPenalty, 0.05);
    EXPECT_DOUBLE_EQ(c.highSeparation, 0.10);
    EXPECT_DOUBLE_EQ(c.lowSeparation, 0.05);
    EXPECT_EQ(c.smallDomThreshold, 2000u);
    EXPECT_FALSE(c.mlEnabled);
    EXPECT_DOUBLE_EQ(c.mlConfidenceThreshold, 0.6);
    EXPECT_EQ(c.compressionPreset, 6u);
    EXPECT_EQ(c.cacheCapacity, 10000u);
    EXPECT_EQ(c.prototypesDir, fs::path("prototypes"));
    EXPECT_EQ(c.modelPath, fs::path("models/phishing_model.json"));
    EXPECT_TRUE(c.IsValid());
}

TEST_F(DetectionConfigTest, ParseStrategy_KnownNamesOnly) {
    EXPECT_EQ(ParseStrategy("flat"), ScoringStrategy::Flat);
    EXPECT_EQ(ParseStrategy("clustered"), ScoringStrategy::Clustered);
    EXPECT_FALSE(ParseStrategy("Flat").has_value());
    EXPECT_STREQ(StrategyToString(ScoringStrategy::Flat), "flat");
}

TEST_F(DetectionConfigTest, IsValid_RejectsInconsistentValues) {
    auto c = DetectionConfig::CreateDefault();
    c.highSeparation = 0.01;
    EXPECT_FALSE(c.IsValid());

    c = DetectionConfig::CreateDefault();
    c.mlConfidenceThreshold = 1.5;
    EXPECT_FALSE(c.IsValid());

    c = DetectionConfig::CreateDefault();
    c.compressionPreset = 10;
    EXPECT_FALSE(c.IsValid());

    c = DetectionConfig::CreateDefault();
    c.cacheCapacity = 0;
    EXPECT_FALSE(c.IsValid());
}

// ============================================================================
// JSON
// ============================================================================
TEST_F(DetectionConfigTest, ApplyConfigJson_OverridesListedKeys) {
    const Utils::JSON::Json j{
        { "strategy", "flat" },
        { "minimal_input_penalty", 0.1 },
        { "small_dom_threshold", 500 },
        { "ml_enabled", true },
        { "model_path", "m.json" },
        { "unrelated", 42 }
    };

    auto c = DetectionConfig::CreateDefault();
    ASSERT_TRUE(ApplyConfigJson(j, c));

    EXPECT_EQ(c.strategy, ScoringStrategy::Flat);
    EXPECT_DOUBLE_EQ(c.minimalInputPenalty, 0.1);
    EXPECT_EQ(c.smallDomThreshold, 500u);
    EXPECT_TRUE(c.mlEnabled);
    EXPECT_EQ(c.modelPath, fs::path("m.json"));
    EXPECT_EQ(c.minimalInputThreshold, 300u);
}

TEST_F(DetectionConfigTest, ApplyConfigJson_WrongType_LeavesConfigUnchanged) {
    const Utils::JSON::Json j{ { "strategy", "flat" }, { "cache_capacity", "big" } };

    auto c = DetectionConfig::CreateDefault();
    Utils::JSON::Error err;
    EXPECT_FALSE(ApplyConfigJson(j, c, &err));
    EXPECT_NE(err.message.find("cache_capacity"), std::string::npos);
    EXPECT_EQ(c.strategy, ScoringStrategy::Clustered);
}

TEST_F(DetectionConfigTest, ApplyConfigJson_PresetBeyond32Bits_RejectedNotWrapped) {
    const Utils::JSON::Json j{ { "strategy", "flat" }, { "compression_preset", 4294967302ULL } };

    auto c = DetectionConfig::CreateDefault();
    c.compressionPreset = 3;
    Utils::JSON::Error err;
    EXPECT_FALSE(ApplyConfigJson(j, c, &err));
    EXPECT_NE(err.message.find("compression_preset"), std::string::npos);
    EXPECT_EQ(c.compressionPreset, 3u);
    EXPECT_EQ(c.strategy, ScoringStrategy::Clustered);
}

TEST_F(DetectionConfigTest, ApplyConfigJson_PresetOutOfLzmaRange_FailsValidation) {
    auto c = DetectionConfig::CreateDefault();
    ASSERT_TRUE(ApplyConfigJson(Utils::JSON::Json{ { "compression_preset", 10 } }, c));
    EXPECT_EQ(c.compressionPreset, 10u);
    EXPECT_FALSE(c.IsValid());
}

TEST_F(DetectionConfigTest, ApplyConfigJson_NegativeCount_Rejected) {
    auto c = DetectionConfig::CreateDefault();
    EXPECT_FALSE(ApplyConfigJson(Utils::JSON::Json{ { "minimal_input_threshold", -1 } }, c));
}

TEST_F(DetectionConfigTest, ApplyConfigJson_UnknownStrategy_Rejected) {
    auto c = DetectionConfig::CreateDefault();
    Utils::JSON::Error err;
    EXPECT_FALSE(ApplyConfigJson(Utils::JSON::Json{ { "strategy", "hybrid" } }, c, &err));
    EXPECT_NE(err.message.find("hybrid"), std::string::npos);
}

TEST_F(DetectionConfigTest, ApplyConfigJson_NonObject_Rejected) {
    auto c = DetectionConfig::CreateDefault();
    EXPECT_FALSE(ApplyConfigJson(Utils::JSON::Json::array(), c));
}

TEST_F(DetectionConfigTest, ToJson_RoundTripsThroughApply) {
    auto source = DetectionConfig::CreateDefault();
    source.strategy = ScoringStrategy::Flat;
    source.lowSeparation = 0.02;
    source.prototypesDir = "/srv/prototypes";

    auto copy = DetectionConfig::CreateDefault();
    ASSERT_TRUE(ApplyConfigJson(source.ToJson(), copy));
    EXPECT_EQ(copy.strategy, ScoringStrategy::Flat);
    EXPECT_DOUBLE_EQ(copy.lowSeparation, 0.02);
    EXPECT_EQ(copy.prototypesDir, fs::path("/srv/prototypes"));
}

// ============================================================================
// ENVIRONMENT
// ============================================================================
TEST_F(DetectionConfigTest, ApplyEnvironmentOverrides_TypedValues) {
    env["PHISHSHAPE_STRATEGY"] = "flat";
    env["PHISHSHAPE_ML_ENABLED"] = "true";
    env["PHISHSHAPE_ML_CONFIDENCE_THRESHOLD"] = "0.75";
    env["PHISHSHAPE_PROTOTYPES_DIR"] = "/data/protos";

    auto c = DetectionConfig::CreateDefault();
    ASSERT_TRUE(ApplyEnvironmentOverrides(c, FakeEnvironment()));

    EXPECT_EQ(c.strategy, ScoringStrategy::Flat);
    EXPECT_TRUE(c.mlEnabled);
    EXPECT_DOUBLE_EQ(c.mlConfidenceThreshold, 0.75);
    EXPECT_EQ(c.prototypesDir, fs::path("/data/protos"));
}

TEST_F(DetectionConfigTest, ApplyEnvironmentOverrides_Unparsable_Fails) {
    env["PHISHSHAPE_CACHE_CAPACITY"] = "lots";

    auto c = DetectionConfig::CreateDefault();
    Utils::JSON::Error err;
    EXPECT_FALSE(ApplyEnvironmentOverrides(c, FakeEnvironment(), &err));
    EXPECT_NE(err.message.find("PHISHSHAPE_CACHE_CAPACITY"), std::string::npos);
}

TEST_F(DetectionConfigTest, ApplyEnvironmentOverrides_NothingSet_NoChange) {
    auto c = DetectionConfig::CreateDefault();
    ASSERT_TRUE(ApplyEnvironmentOverrides(c, FakeEnvironment()));
    EXPECT_EQ(c.strategy, ScoringStrategy::Clustered);
}

// ============================================================================
// LAYERED LOAD
// ============================================================================
TEST_F(DetectionConfigTest, LoadDetectionConfig_FileThenEnvironment) {
    const auto path = WriteConfig(R"({
        // tuned for the staging corpus
        "strategy": "flat",
        "minimal_input_penalty": 0.08,
        "low_separation": 0.03
    })");
    env["PHISHSHAPE_MINIMAL_INPUT_PENALTY"] = "0.02";

    DetectionConfig c;
    Utils::JSON::Error err;
    ASSERT_TRUE(LoadDetectionConfig(path, c, &err, FakeEnvironment())) << err.message;

    EXPECT_EQ(c.strategy, ScoringStrategy::Flat);
    EXPECT_DOUBLE_EQ(c.minimalInputPenalty, 0.02);
    EXPECT_DOUBLE_EQ(c.lowSeparation, 0.03);
}

TEST_F(DetectionConfigTest, LoadDetectionConfig_EmptyPath_DefaultsPlusEnvironment) {
    env["PHISHSHAPE_COMPRESSION_PRESET"] = "3";

    DetectionConfig c;
    ASSERT_TRUE(LoadDetectionConfig({}, c, nullptr, FakeEnvironment()));
    EXPECT_EQ(c.compressionPreset, 3u);
}

TEST_F(DetectionConfigTest, LoadDetectionConfig_OutOfRangeResult_Fails) {
    const auto path = WriteConfig(R"({ "high_separation": 0.01, "low_separation": 0.05 })");

    DetectionConfig c;
    Utils::JSON::Error err;
    EXPECT_FALSE(LoadDetectionConfig(path, c, &err, FakeEnvironment()));
    EXPECT_TRUE(err.hasError());
}

TEST_F(DetectionConfigTest, LoadDetectionConfig_MissingFile_Fails) {
    DetectionConfig c;
    Utils::JSON::Error err;
    EXPECT_FALSE(LoadDetectionConfig(testDir / "absent.json", c, &err, FakeEnvironment()));
    EXPECT_TRUE(err.hasError());
}
