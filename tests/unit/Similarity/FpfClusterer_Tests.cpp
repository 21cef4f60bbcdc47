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
#include "../../../src/Similarity/FpfClusterer.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <stdexcept>
#include <vector>

using namespace PhishShape::Similarity;

// ============================================================================
// TEST FIXTURE
// ============================================================================
// Points on a line at 0, 1, 2, 10, 11; distance is |a - b| / 11.
class FpfClustererTest : public ::testing::Test {
protected:
    static DistanceMatrix LineMatrix(const std::vector<double>& positions) {
        const size_t n = positions.size();
        DistanceMatrix m(n);
        for (size_t i = 0; i < n; ++i)
            for (size_t j = i + 1; j < n; ++j)
                m.SetSymmetric(i, j, std::fabs(positions[i] - positions[j]) / 11.0);
        return m;
    }

    DistanceMatrix line = LineMatrix({ 0, 1, 2, 10, 11 });
};

// ============================================================================
// DIVERSE SUBSET
// ============================================================================
TEST_F(FpfClustererTest, SelectDiverseSubset_ZeroK_Throws) {
    EXPECT_THROW((void)SelectDiverseSubset(line, 0), std::invalid_argument);
}

TEST_F(FpfClustererTest, SelectDiverseSubset_ReturnsKUniqueIndices) {
    for (size_t k = 1; k < line.Size(); ++k) {
        FpfConfig config;
        config.randomSeed = 42 + k;
        const auto picked = SelectDiverseSubset(line, k, config);

        ASSERT_EQ(picked.size(), k);
        const std::set<size_t> unique(picked.begin(), picked.end());
        EXPECT_EQ(unique.size(), k);
        for (size_t idx : picked) EXPECT_LT(idx, line.Size());
    }
}

TEST_F(FpfClustererTest, SelectDiverseSubset_KAtLeastPool_ReturnsWholePoolInOrder) {
    const auto all = SelectDiverseSubset(line, 5);
    EXPECT_EQ(all, (std::vector<size_t>{ 0, 1, 2, 3, 4 }));

    const auto more = SelectDiverseSubset(line, 12);
    EXPECT_EQ(more.size(), 5u);
}

TEST_F(FpfClustererTest, SelectDiverseSubset_AtypicalSeed_FarthestFirstOrder) {
    FpfConfig config;
    config.seedPolicy = SeedPolicy::HighestAverageDistance;

    const auto picked = SelectDiverseSubset(line, 3, config);
    EXPECT_EQ(picked, (std::vector<size_t>{ 4, 0, 2 }));
}

TEST_F(FpfClustererTest, SelectDiverseSubset_FixedSeed_Reproducible) {
    FpfConfig config;
    config.randomSeed = 1234;

    EXPECT_EQ(SelectDiverseSubset(line, 3, config), SelectDiverseSubset(line, 3, config));
}

TEST_F(FpfClustererTest, SelectDiverseSubset_SecondPickIsFarthestFromSeed) {
    FpfConfig config;
    config.randomSeed = 99;
    const auto picked = SelectDiverseSubset(line, 2, config);

    const size_t seed = picked[0];
    double farthest = 0.0;
    for (size_t i = 0; i < line.Size(); ++i) farthest = std::max(farthest, line(seed, i));
    EXPECT_DOUBLE_EQ(line(seed, picked[1]), farthest);
}

TEST_F(FpfClustererTest, SelectDiverseSubset_DuplicatePoints_StillUnique) {
    const auto dupes = LineMatrix({ 3, 3, 3, 3 });
    const auto picked = SelectDiverseSubset(dupes, 3);

    const std::set<size_t> unique(picked.begin(), picked.end());
    EXPECT_EQ(unique.size(), 3u);
}

// ============================================================================
// CLUSTERING
// ============================================================================
TEST_F(FpfClustererTest, ClusterPool_InvalidConfig_Throws) {
    ClusteringConfig config;
    config.minClusters = 5;
    config.maxClusters = 2;
    EXPECT_THROW((void)ClusterPool(line, config), std::invalid_argument);

    config.minClusters = 0;
    EXPECT_THROW((void)ClusterPool(line, config), std::invalid_argument);
}

TEST_F(FpfClustererTest, ClusterPool_EmptyPool_NoClusters) {
    const auto result = ClusterPool(DistanceMatrix{});
    EXPECT_EQ(result.ClusterCount(), 0u);
    EXPECT_TRUE(result.assignments.empty());
}

TEST_F(FpfClustererTest, ClusterPool_TwoGroups_SeparatesThem) {
    ClusteringConfig config;
    config.epsilon = 0.01;

    const auto result = ClusterPool(line, config);

    ASSERT_EQ(result.ClusterCount(), 2u);
    EXPECT_EQ(result.centers, (std::vector<size_t>{ 4, 0 }));
    EXPECT_EQ(result.assignments, (std::vector<size_t>{ 1, 1, 1, 0, 0 }));

    ASSERT_EQ(result.steps.size(), 2u);
    EXPECT_TRUE(result.steps[0].accepted);
    EXPECT_FALSE(result.steps[1].accepted);
    EXPECT_LT(result.steps[1].Reduction(), config.epsilon);
}

TEST_F(FpfClustererTest, ClusterPool_MinClusters_AlwaysReached) {
    ClusteringConfig config;
    config.minClusters = 3;
    config.maxClusters = 4;
    config.epsilon = 1.0;

    const auto result = ClusterPool(line, config);
    EXPECT_EQ(result.ClusterCount(), 3u);
}

TEST_F(FpfClustererTest, ClusterPool_MaxClusters_NeverExceeded) {
    ClusteringConfig config;
    config.minClusters = 1;
    config.maxClusters = 1;

    const auto result = ClusterPool(line, config);
    EXPECT_EQ(result.ClusterCount(), 1u);
    EXPECT_TRUE(result.steps.empty());
    for (size_t a : result.assignments) EXPECT_EQ(a, 0u);
}

TEST_F(FpfClustererTest, ClusterPool_EveryPointAssignedToNearestCenter) {
    ClusteringConfig config;
    config.epsilon = 0.0;
    const auto result = ClusterPool(line, config);

    ASSERT_EQ(result.assignments.size(), line.Size());
    for (size_t i = 0; i < line.Size(); ++i) {
        const double own = line(i, result.centers[result.assignments[i]]);
        for (size_t center : result.centers) {
            EXPECT_LE(own, line(i, center));
        }
    }
}

TEST_F(FpfClustererTest, Members_GroupsInPoolOrder) {
    ClusteringConfig config;
    config.epsilon = 0.01;
    const auto members = ClusterPool(line, config).Members();

    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0], (std::vector<size_t>{ 3, 4 }));
    EXPECT_EQ(members[1], (std::vector<size_t>{ 0, 1, 2 }));
}

// ============================================================================
// VARIANCE
// ============================================================================
TEST_F(FpfClustererTest, PopulationVariance_KnownValues) {
    EXPECT_DOUBLE_EQ(PopulationVariance({}), 0.0);
    EXPECT_DOUBLE_EQ(PopulationVariance({ 2.0, 2.0, 2.0 }), 0.0);
    EXPECT_DOUBLE_EQ(PopulationVariance({ 1.0, 3.0 }), 1.0);
}
