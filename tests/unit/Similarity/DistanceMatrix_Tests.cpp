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
#include "../../../src/Similarity/DistanceMatrix.hpp"

#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

using namespace PhishShape::Similarity;

// ============================================================================
// TEST FIXTURE
// ============================================================================
class DistanceMatrixTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* pages[] = {
            "html body form input input button",
            "html body form input input input button",
            "html body table tr td tr td tr td img",
            "html head script script body iframe div",
            "html body div div div span a a a"
        };
        for (const char* p : pages) {
            std::string s;
            for (int r = 0; r < 8; ++r) { s += p; s += ' '; }
            corpus.emplace_back(s.begin(), s.end());
        }
    }

    std::vector<std::span<const uint8_t>> Views() const {
        std::vector<std::span<const uint8_t>> views;
        for (const auto& c : corpus) views.emplace_back(c.data(), c.size());
        return views;
    }

    std::vector<std::vector<uint8_t>> corpus;
    CompressionOracle oracle;
    NcdMetric metric{ oracle };
};

// ============================================================================
// CONSTRUCTION
// ============================================================================
TEST_F(DistanceMatrixTest, Constructor_Size_ZeroFilled) {
    DistanceMatrix m(3);
    EXPECT_EQ(m.Size(), 3u);
    EXPECT_FALSE(m.Empty());
    for (size_t i = 0; i < 3; ++i)
        for (size_t j = 0; j < 3; ++j)
            EXPECT_DOUBLE_EQ(m(i, j), 0.0);
}

TEST_F(DistanceMatrixTest, FromValues_WrongCellCount_Throws) {
    EXPECT_THROW((void)DistanceMatrix::FromValues(2, { 0.0, 0.5, 0.5 }), std::invalid_argument);
}

TEST_F(DistanceMatrixTest, FromValues_Asymmetric_Throws) {
    EXPECT_THROW((void)DistanceMatrix::FromValues(2, { 0.0, 0.5, 0.4, 0.0 }), std::invalid_argument);
}

TEST_F(DistanceMatrixTest, FromValues_NonZeroDiagonal_Throws) {
    EXPECT_THROW((void)DistanceMatrix::FromValues(2, { 0.1, 0.5, 0.5, 0.0 }), std::invalid_argument);
}

TEST_F(DistanceMatrixTest, At_OutOfRange_Throws) {
    const auto m = DistanceMatrix::FromValues(2, { 0.0, 0.5, 0.5, 0.0 });
    EXPECT_DOUBLE_EQ(m.At(0, 1), 0.5);
    EXPECT_THROW((void)m.At(2, 0), std::out_of_range);
}

TEST_F(DistanceMatrixTest, SetSymmetric_WritesBothCells_IgnoresDiagonal) {
    DistanceMatrix m(3);
    m.SetSymmetric(0, 2, 0.7);
    m.SetSymmetric(1, 1, 0.9);

    EXPECT_DOUBLE_EQ(m(0, 2), 0.7);
    EXPECT_DOUBLE_EQ(m(2, 0), 0.7);
    EXPECT_DOUBLE_EQ(m(1, 1), 0.0);
}

TEST_F(DistanceMatrixTest, AverageDistance_ExcludesSelf) {
    const auto m = DistanceMatrix::FromValues(3, {
        0.0, 0.2, 0.4,
        0.2, 0.0, 0.6,
        0.4, 0.6, 0.0 });
    EXPECT_DOUBLE_EQ(m.AverageDistance(0), 0.3);
    EXPECT_DOUBLE_EQ(m.AverageDistance(2), 0.5);
    EXPECT_DOUBLE_EQ(DistanceMatrix(1).AverageDistance(0), 0.0);
}

// ============================================================================
// COMPUTATION
// ============================================================================
TEST_F(DistanceMatrixTest, Compute_IsSymmetricWithZeroDiagonal) {
    const auto m = ComputeDistanceMatrix(Views(), metric);

    ASSERT_EQ(m.Size(), corpus.size());
    for (size_t i = 0; i < m.Size(); ++i) {
        EXPECT_DOUBLE_EQ(m(i, i), 0.0);
        for (size_t j = 0; j < m.Size(); ++j) {
            EXPECT_DOUBLE_EQ(m(i, j), m(j, i));
            EXPECT_GE(m(i, j), 0.0);
        }
    }
}

TEST_F(DistanceMatrixTest, Compute_CellsMatchMetric) {
    const auto m = ComputeDistanceMatrix(Views(), metric);
    const auto views = Views();
    EXPECT_DOUBLE_EQ(m(0, 1), metric.Distance(views[0], views[1]));
    EXPECT_DOUBLE_EQ(m(2, 4), metric.Distance(views[2], views[4]));
}

TEST_F(DistanceMatrixTest, Compute_ParallelWorkers_MatchSequential) {
    const auto sequential = ComputeDistanceMatrix(Views(), metric, { 1 });

    DistanceMatrixOptions parallel;
    parallel.workerCount = 3;
    const auto threaded = ComputeDistanceMatrix(Views(), metric, parallel);

    DistanceMatrixOptions automatic;
    automatic.workerCount = 0;
    const auto hardware = ComputeDistanceMatrix(Views(), metric, automatic);

    for (size_t i = 0; i < sequential.Size(); ++i) {
        for (size_t j = 0; j < sequential.Size(); ++j) {
            EXPECT_DOUBLE_EQ(sequential(i, j), threaded(i, j));
            EXPECT_DOUBLE_EQ(sequential(i, j), hardware(i, j));
        }
    }
}

TEST_F(DistanceMatrixTest, Compute_WorkerStartFailsMidway_StartedWorkersFinish) {
    const auto sequential = ComputeDistanceMatrix(Views(), metric, { 1 });

    size_t launches = 0;
    DistanceMatrixOptions options;
    options.workerCount = 4;
    options.launcher = [&launches](std::function<void()> job) {
        if (++launches > 1) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread limit reached");
        }
        return std::thread(std::move(job));
    };

    const auto m = ComputeDistanceMatrix(Views(), metric, options);
    EXPECT_EQ(launches, 2u);
    for (size_t i = 0; i < sequential.Size(); ++i) {
        for (size_t j = 0; j < sequential.Size(); ++j) {
            EXPECT_DOUBLE_EQ(sequential(i, j), m(i, j));
        }
    }
}

TEST_F(DistanceMatrixTest, Compute_NoWorkerStarts_ComputedOnCallingThread) {
    const auto sequential = ComputeDistanceMatrix(Views(), metric, { 1 });

    DistanceMatrixOptions options;
    options.workerCount = 3;
    options.launcher = [](std::function<void()>) -> std::thread {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                "thread limit reached");
    };

    const auto m = ComputeDistanceMatrix(Views(), metric, options);
    ASSERT_EQ(m.Size(), sequential.Size());
    EXPECT_DOUBLE_EQ(m(0, 4), sequential(0, 4));
    EXPECT_DOUBLE_EQ(m(2, 3), sequential(2, 3));
}

TEST_F(DistanceMatrixTest, Compute_TrivialInputs_NoPairs) {
    EXPECT_TRUE(ComputeDistanceMatrix({}, metric).Empty());

    const auto views = Views();
    const auto single = ComputeDistanceMatrix({ views[0] }, metric);
    EXPECT_EQ(single.Size(), 1u);
    EXPECT_DOUBLE_EQ(single(0, 0), 0.0);
}
