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
#include "../../../src/Prototypes/PrototypeBuilder.hpp"
#include "../../../src/Prototypes/PrototypeStore.hpp"
#include "../../../src/Utils/FileUtils.hpp"
#include "../../../src/Utils/JSONUtils.hpp"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

using namespace PhishShape;
using namespace PhishShape::Prototypes;
namespace fs = std::filesystem;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class PrototypeStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        root = fs::temp_directory_path() / ("phishshape_store_" + std::to_string(rd()));
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    static Sample MakeSample(const std::string& id, const std::string& dom, const std::string& url = {}) {
        Sample s;
        s.id = id;
        s.bytes.assign(dom.begin(), dom.end());
        s.url = url;
        return s;
    }

    static Prototype MakePrototype(const std::string& dom, Label label, uint32_t clusterId) {
        Prototype p;
        p.bytes.assign(dom.begin(), dom.end());
        p.label = label;
        p.clusterId = clusterId;
        return p;
    }

    void WriteFile(const fs::path& path, const std::string& content) {
        ASSERT_TRUE(Utils::FileUtils::WriteAllBytes(path, content.data(), content.size()));
    }

    fs::path root;
};

// ============================================================================
// IN-MEMORY
// ============================================================================
TEST_F(PrototypeStoreTest, DefaultStore_IsEmpty) {
    const PrototypeStore store;
    EXPECT_FALSE(store.HasLegitimate());
    EXPECT_FALSE(store.HasPhishing());
    EXPECT_EQ(store.PhishingCount(), 0u);
    EXPECT_EQ(store.ClusterCount(), 0u);
}

TEST_F(PrototypeStoreTest, Constructor_DropsEmptyClusters_KeepsOrder) {
    std::vector<PrototypeCluster> clusters;
    clusters.push_back({ 3, { MakePrototype("a", Label::Phish, 3) } });
    clusters.push_back({ 1, {} });
    clusters.push_back({ 2, { MakePrototype("b", Label::Phish, 2), MakePrototype("c", Label::Phish, 2) } });

    const PrototypeStore store({ MakePrototype("l", Label::Legit, 0) }, std::move(clusters));

    ASSERT_EQ(store.ClusterCount(), 2u);
    EXPECT_EQ(store.PhishingClusters()[0].id, 3u);
    EXPECT_EQ(store.PhishingClusters()[1].id, 2u);
    EXPECT_EQ(store.PhishingCount(), 3u);
    EXPECT_EQ(store.LegitimateCount(), 1u);
}

TEST_F(PrototypeStoreTest, ToJson_SummarizesCounts) {
    std::vector<PrototypeCluster> clusters;
    clusters.push_back({ 1, { MakePrototype("a", Label::Phish, 1) } });
    const PrototypeStore store({ MakePrototype("l", Label::Legit, 0), MakePrototype("m", Label::Legit, 0) },
                               std::move(clusters));

    Utils::JSON::Json j;
    ASSERT_TRUE(Utils::JSON::Parse(store.ToJson(), j));
    EXPECT_EQ(j["legitimate"].get<size_t>(), 2u);
    EXPECT_EQ(j["phishing"].get<size_t>(), 1u);
    ASSERT_EQ(j["clusters"].size(), 1u);
    EXPECT_EQ(j["clusters"][0]["id"].get<uint32_t>(), 1u);
}

// ============================================================================
// FLAT LAYOUT
// ============================================================================
TEST_F(PrototypeStoreTest, LoadFlat_RoundTripsWrittenPrototypes) {
    const auto p1 = MakeSample("s1", "html body form input input button", "https://p1.example");
    const auto p2 = MakeSample("s2", "html body form input button iframe");
    const auto l1 = MakeSample("s3", "html head body div div nav footer", "https://l1.example");

    ASSERT_TRUE(WritePrototypes({ &p1, &p2 }, Label::Phish, root / "phishing", std::nullopt));
    ASSERT_TRUE(WritePrototypes({ &l1 }, Label::Legit, root / "legitimate", std::nullopt));

    const auto store = PrototypeStore::LoadFromRoot(root, StoreLayout::Flat);

    ASSERT_EQ(store->ClusterCount(), 1u);
    const auto& cluster = store->PhishingClusters()[0];
    EXPECT_EQ(cluster.id, 1u);
    ASSERT_EQ(cluster.prototypes.size(), 2u);
    EXPECT_EQ(cluster.prototypes[0].bytes, p1.bytes);
    EXPECT_EQ(cluster.prototypes[0].url, "https://p1.example");
    EXPECT_EQ(cluster.prototypes[0].sourceId, "phish_prototype_01");
    EXPECT_EQ(cluster.prototypes[0].label, Label::Phish);
    EXPECT_EQ(cluster.prototypes[1].bytes, p2.bytes);
    EXPECT_EQ(cluster.prototypes[1].clusterId, 1u);

    ASSERT_EQ(store->LegitimateCount(), 1u);
    EXPECT_EQ(store->Legitimate()[0].bytes, l1.bytes);
    EXPECT_EQ(store->Legitimate()[0].clusterId, 0u);
    EXPECT_EQ(store->Legitimate()[0].label, Label::Legit);
}

TEST_F(PrototypeStoreTest, LoadFlat_MissingDirectories_EmptyStore) {
    const auto store = PrototypeStore::LoadFromRoot(root / "absent", StoreLayout::Flat);
    ASSERT_NE(store, nullptr);
    EXPECT_FALSE(store->HasPhishing());
    EXPECT_FALSE(store->HasLegitimate());
}

TEST_F(PrototypeStoreTest, LoadFlat_SkipsEmptyFiles) {
    WriteFile(root / "phishing" / "a.dom", "html form");
    WriteFile(root / "phishing" / "b.dom", "");
    WriteFile(root / "legitimate" / "c.dom", "html body");

    const auto store = PrototypeStore::LoadFlat(root / "phishing", root / "legitimate");
    EXPECT_EQ(store->PhishingCount(), 1u);
    EXPECT_EQ(store->LegitimateCount(), 1u);
}

// ============================================================================
// CLUSTERED LAYOUT
// ============================================================================
TEST_F(PrototypeStoreTest, LoadClustered_OrdersByNumericId_IgnoresOtherDirs) {
    const auto clustered = root / "phishing_clustered";
    WriteFile(clustered / "cluster_10" / "x.dom", "html ten");
    WriteFile(clustered / "cluster_2" / "y.dom", "html two");
    WriteFile(clustered / "cluster_1" / "z.dom", "html one");
    WriteFile(clustered / "cluster_0" / "bad.dom", "html zero");
    WriteFile(clustered / "cluster_3x" / "bad.dom", "html junk");
    WriteFile(clustered / "notes" / "bad.dom", "html notes");
    fs::create_directories(clustered / "cluster_4");
    WriteFile(root / "legitimate" / "l.dom", "html legit");

    const auto store = PrototypeStore::LoadFromRoot(root, StoreLayout::Clustered);

    ASSERT_EQ(store->ClusterCount(), 3u);
    EXPECT_EQ(store->PhishingClusters()[0].id, 1u);
    EXPECT_EQ(store->PhishingClusters()[1].id, 2u);
    EXPECT_EQ(store->PhishingClusters()[2].id, 10u);
    EXPECT_EQ(store->PhishingClusters()[2].prototypes[0].clusterId, 10u);
    EXPECT_EQ(store->LegitimateCount(), 1u);
}

TEST_F(PrototypeStoreTest, LoadClustered_LeadingZeroDirs_IgnoredSoIdsStayUnique) {
    const auto clustered = root / "phishing_clustered";
    WriteFile(clustered / "cluster_1" / "one.dom", "html one");
    WriteFile(clustered / "cluster_01" / "alias.dom", "html alias");
    WriteFile(clustered / "cluster_007" / "bond.dom", "html bond");
    WriteFile(root / "legitimate" / "l.dom", "html legit");

    const auto store = PrototypeStore::LoadFromRoot(root, StoreLayout::Clustered);

    ASSERT_EQ(store->ClusterCount(), 1u);
    EXPECT_EQ(store->PhishingClusters()[0].id, 1u);
    ASSERT_EQ(store->PhishingClusters()[0].prototypes.size(), 1u);
    EXPECT_EQ(store->PhishingCount(), 1u);
}

TEST_F(PrototypeStoreTest, LoadClustered_MissingClusterRoot_LegitOnly) {
    WriteFile(root / "legitimate" / "l.dom", "html legit");

    const auto store = PrototypeStore::LoadFromRoot(root, StoreLayout::Clustered);
    EXPECT_FALSE(store->HasPhishing());
    EXPECT_TRUE(store->HasLegitimate());
}
