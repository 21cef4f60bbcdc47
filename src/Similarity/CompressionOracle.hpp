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
 * PhishShape — Compression Oracle
 * ============================================================================
 *
 * @file CompressionOracle.hpp
 * @brief Compressed-size oracle backed by LZMA (xz container)
 *
 * The oracle answers one question: how many bytes does this sequence
 * occupy after compression. It is the C(x) term of the normalized
 * compression distance.
 *
 * Determinism:
 *   Every call uses the same preset and integrity check, so identical
 *   input always yields the same size and results can be memoized.
 *
 * Thread Safety:
 *   All methods are thread-safe. The memo cache is the only mutable
 *   state and is guarded by its own reader-writer lock.
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include "../Utils/LRUCache.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>

namespace PhishShape::Similarity {

    /// Default LZMA preset (matches the xz command line default)
    inline constexpr uint32_t kDefaultCompressionPreset = 6;

    /// Default number of memoized single-sequence sizes
    inline constexpr size_t kDefaultCacheCapacity = 10000;

    /**
     * @brief Raised when the compressor rejects its input or runs out of memory.
     *
     * Never expected for well-formed byte sequences. Treated as fatal by
     * callers because it points at a corrupted prototype store.
     */
    class CompressionError : public std::runtime_error {
    public:
        CompressionError(const std::string& what, int lzmaCode)
            : std::runtime_error(what), m_code(lzmaCode) {}

        [[nodiscard]] int Code() const noexcept { return m_code; }

    private:
        int m_code;
    };

    struct CompressionOracleStats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        size_t entries = 0;
        size_t capacity = 0;
    };

    /**
     * @brief Memoizing LZMA compressed-size oracle.
     */
    class CompressionOracle final {
    public:
        /**
         * @param preset LZMA preset 0..9
         * @param cacheCapacity Maximum memoized entries (LRU eviction)
         * @throws std::invalid_argument if preset is out of range
         */
        explicit CompressionOracle(uint32_t preset = kDefaultCompressionPreset,
                                   size_t cacheCapacity = kDefaultCacheCapacity);

        CompressionOracle(const CompressionOracle&) = delete;
        CompressionOracle& operator=(const CompressionOracle&) = delete;

        /**
         * @brief Compressed size of @p data, memoized by exact content.
         *
         * Empty input yields the size of an empty xz stream (non-zero).
         *
         * @throws CompressionError on compressor failure
         */
        [[nodiscard]] size_t CompressedSize(std::span<const uint8_t> data) const;

        /**
         * @brief Compressed size without touching the memo cache.
         *
         * Used for joint sequences that are unlikely to repeat.
         *
         * @throws CompressionError on compressor failure
         */
        [[nodiscard]] size_t CompressedSizeUncached(std::span<const uint8_t> data) const;

        /**
         * @brief Compressed size of the concatenation a‖b, uncached.
         */
        [[nodiscard]] size_t ConcatenatedSize(std::span<const uint8_t> a,
                                              std::span<const uint8_t> b) const;

        [[nodiscard]] uint32_t Preset() const noexcept { return m_preset; }

        [[nodiscard]] CompressionOracleStats Stats() const noexcept;

        void ClearCache() noexcept;

    private:
        uint32_t m_preset;
        mutable Utils::LRUCache<std::string, size_t> m_cache;
    };

} // namespace PhishShape::Similarity
