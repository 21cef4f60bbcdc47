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
#include "DistanceMatrix.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace PhishShape::Similarity {

    DistanceMatrix::DistanceMatrix(size_t n)
        : m_size(n)
        , m_values(n * n, 0.0) {
    }

    DistanceMatrix DistanceMatrix::FromValues(size_t n, std::vector<double> values) {
        if (values.size() != n * n) {
            throw std::invalid_argument("distance table has " + std::to_string(values.size()) +
                                        " cells, expected " + std::to_string(n * n));
        }
        for (size_t i = 0; i < n; ++i) {
            if (values[i * n + i] != 0.0) {
                throw std::invalid_argument("distance table diagonal must be zero at " + std::to_string(i));
            }
            for (size_t j = i + 1; j < n; ++j) {
                if (values[i * n + j] != values[j * n + i]) {
                    throw std::invalid_argument("distance table is not symmetric at (" +
                                                std::to_string(i) + ", " + std::to_string(j) + ")");
                }
            }
        }

        DistanceMatrix m;
        m.m_size = n;
        m.m_values = std::move(values);
        return m;
    }

    double DistanceMatrix::At(size_t i, size_t j) const {
        if (i >= m_size || j >= m_size) {
            throw std::out_of_range("distance matrix index (" + std::to_string(i) + ", " +
                                    std::to_string(j) + ") outside " + std::to_string(m_size));
        }
        return (*this)(i, j);
    }

    void DistanceMatrix::SetSymmetric(size_t i, size_t j, double value) noexcept {
        if (i == j) return;
        m_values[i * m_size + j] = value;
        m_values[j * m_size + i] = value;
    }

    double DistanceMatrix::AverageDistance(size_t i) const noexcept {
        if (m_size < 2) return 0.0;

        double sum = 0.0;
        for (size_t j = 0; j < m_size; ++j) {
            sum += (*this)(i, j);
        }
        return sum / static_cast<double>(m_size - 1);
    }

    DistanceMatrix ComputeDistanceMatrix(const std::vector<std::span<const uint8_t>>& items,
                                         const NcdMetric& metric,
                                         const DistanceMatrixOptions& options) {
        const size_t n = items.size();
        DistanceMatrix matrix(n);
        if (n < 2) {
            return matrix;
        }

        size_t workers = options.workerCount;
        if (workers == 0) {
            workers = std::max<unsigned>(1u, std::thread::hardware_concurrency());
        }
        workers = std::min(workers, n - 1);

        const size_t totalPairs = n * (n - 1) / 2;
        PS_LOG_INFO("DistanceMatrix", "Computing %zu pairwise distances over %zu samples with %zu worker(s)",
                    totalPairs, n, workers);

        std::atomic<size_t> nextRow{ 0 };
        std::atomic<size_t> rowsDone{ 0 };
        std::atomic<bool> failed{ false };
        std::exception_ptr firstError;
        std::mutex errorMutex;

        // Rows are claimed dynamically since row i holds n-1-i cells
        auto work = [&]() {
            for (;;) {
                if (failed.load(std::memory_order_acquire)) return;
                const size_t i = nextRow.fetch_add(1, std::memory_order_relaxed);
                if (i >= n - 1) return;

                try {
                    for (size_t j = i + 1; j < n; ++j) {
                        matrix.SetSymmetric(i, j, metric.Distance(items[i], items[j]));
                    }
                }
                catch (const std::exception&) {
                    std::lock_guard<std::mutex> lock(errorMutex);
                    if (!firstError) {
                        firstError = std::current_exception();
                    }
                    failed.store(true, std::memory_order_release);
                    return;
                }

                const size_t done = rowsDone.fetch_add(1, std::memory_order_relaxed) + 1;
                if (done % 10 == 0 || done == n - 1) {
                    PS_LOG_DEBUG("DistanceMatrix", "Rows completed: %zu/%zu", done, n - 1);
                }
            }
        };

        if (workers == 1) {
            work();
        }
        else {
            std::vector<std::thread> threads;
            threads.reserve(workers);
            try {
                for (size_t w = 0; w < workers; ++w) {
                    threads.push_back(options.launcher ? options.launcher(work) : std::thread(work));
                }
            }
            catch (const std::system_error& e) {
                PS_LOG_WARN("DistanceMatrix", "Started %zu of %zu worker(s): %s", threads.size(), workers, e.what());
            }

            const bool anyRunning = std::any_of(threads.begin(), threads.end(),
                                                [](const std::thread& t) { return t.joinable(); });
            if (!anyRunning) {
                work();
            }
            for (auto& t : threads) {
                if (t.joinable()) {
                    t.join();
                }
            }
        }

        if (firstError) {
            std::rethrow_exception(firstError);
        }

        PS_LOG_INFO("DistanceMatrix", "Distance matrix complete (%zu x %zu)", n, n);
        return matrix;
    }

} // namespace PhishShape::Similarity
