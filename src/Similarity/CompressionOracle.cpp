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
 * PhishShape — Compression Oracle Implementation
 * ============================================================================
 *
 * @file CompressionOracle.cpp
 * @brief liblzma single-call buffer encoder wrapped as a size oracle
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#include "CompressionOracle.hpp"
#include "../Utils/Logger.hpp"

#include <lzma.h>

#include <vector>

namespace PhishShape::Similarity {

    namespace {

        [[nodiscard]] const char* LzmaRetToString(lzma_ret ret) noexcept {
            switch (ret) {
            case LZMA_OK:               return "LZMA_OK";
            case LZMA_MEM_ERROR:        return "LZMA_MEM_ERROR";
            case LZMA_MEMLIMIT_ERROR:   return "LZMA_MEMLIMIT_ERROR";
            case LZMA_OPTIONS_ERROR:    return "LZMA_OPTIONS_ERROR";
            case LZMA_UNSUPPORTED_CHECK:return "LZMA_UNSUPPORTED_CHECK";
            case LZMA_BUF_ERROR:        return "LZMA_BUF_ERROR";
            case LZMA_DATA_ERROR:       return "LZMA_DATA_ERROR";
            case LZMA_PROG_ERROR:       return "LZMA_PROG_ERROR";
            default:                    return "LZMA_UNKNOWN";
            }
        }

        /**
         * @brief Encode a set of segments as one xz stream and return its size.
         *
         * Segments are fed through a streaming encoder so the joint size of
         * a‖b is computed without materializing the concatenation.
         */
        [[nodiscard]] size_t EncodeSegments(std::span<const uint8_t> first,
                                            std::span<const uint8_t> second,
                                            uint32_t preset) {
            lzma_stream strm = LZMA_STREAM_INIT;
            lzma_ret ret = lzma_easy_encoder(&strm, preset, LZMA_CHECK_CRC64);
            if (ret != LZMA_OK) {
                PS_LOG_ERROR("Compression", "lzma_easy_encoder failed: %s", LzmaRetToString(ret));
                throw CompressionError(std::string("lzma_easy_encoder failed: ") + LzmaRetToString(ret),
                                       static_cast<int>(ret));
            }

            std::vector<uint8_t> outBuf(64 * 1024);
            size_t total = 0;

            const std::span<const uint8_t> segments[2] = { first, second };
            size_t segmentIndex = 0;

            strm.next_in = nullptr;
            strm.avail_in = 0;
            lzma_action action = LZMA_RUN;

            for (;;) {
                if (strm.avail_in == 0 && action == LZMA_RUN) {
                    while (segmentIndex < 2 && segments[segmentIndex].empty()) {
                        ++segmentIndex;
                    }
                    if (segmentIndex < 2) {
                        strm.next_in = segments[segmentIndex].data();
                        strm.avail_in = segments[segmentIndex].size();
                        ++segmentIndex;
                    }
                    else {
                        action = LZMA_FINISH;
                    }
                }

                strm.next_out = outBuf.data();
                strm.avail_out = outBuf.size();

                ret = lzma_code(&strm, action);
                total += outBuf.size() - strm.avail_out;

                if (ret == LZMA_STREAM_END) {
                    break;
                }
                if (ret != LZMA_OK) {
                    lzma_end(&strm);
                    PS_LOG_ERROR("Compression", "lzma_code failed: %s", LzmaRetToString(ret));
                    throw CompressionError(std::string("lzma_code failed: ") + LzmaRetToString(ret),
                                           static_cast<int>(ret));
                }
            }

            lzma_end(&strm);
            return total;
        }

    } // anonymous namespace

    CompressionOracle::CompressionOracle(uint32_t preset, size_t cacheCapacity)
        : m_preset(preset)
        , m_cache(cacheCapacity) {
        if (preset > 9) {
            throw std::invalid_argument("LZMA preset must be in 0..9, got " + std::to_string(preset));
        }
    }

    size_t CompressionOracle::CompressedSize(std::span<const uint8_t> data) const {
        std::string key(reinterpret_cast<const char*>(data.data()), data.size());

        if (auto cached = m_cache.Get(key)) {
            return *cached;
        }

        const size_t size = EncodeSegments(data, {}, m_preset);
        m_cache.Put(std::move(key), size);
        return size;
    }

    size_t CompressionOracle::CompressedSizeUncached(std::span<const uint8_t> data) const {
        return EncodeSegments(data, {}, m_preset);
    }

    size_t CompressionOracle::ConcatenatedSize(std::span<const uint8_t> a,
                                               std::span<const uint8_t> b) const {
        return EncodeSegments(a, b, m_preset);
    }

    CompressionOracleStats CompressionOracle::Stats() const noexcept {
        CompressionOracleStats stats;
        stats.hits = m_cache.HitCount();
        stats.misses = m_cache.MissCount();
        stats.evictions = m_cache.EvictionCount();
        stats.entries = m_cache.Size();
        stats.capacity = m_cache.Capacity();
        return stats;
    }

    void CompressionOracle::ClearCache() noexcept {
        m_cache.Clear();
    }

} // namespace PhishShape::Similarity
