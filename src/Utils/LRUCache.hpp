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
#pragma once

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <utility>

namespace PhishShape {
namespace Utils {

        // ============================================================================
        // LRU CACHE
        // ============================================================================

        /**
         * @brief Thread-safe bounded LRU (Least Recently Used) cache
         *
         * - O(1) lookup, insert, and eviction
         * - Bounded by entry count
         * - Hit/miss/eviction counters
         *
         * Architecture:
         * - Hash map from key to list position
         * - Recency list, most recently used at the front
         * - Reader-writer lock; lookups take the exclusive side because
         *   they reorder the recency list
         */
        template<typename Key, typename Value, typename Hash = std::hash<Key>>
        class LRUCache {
        public:
            explicit LRUCache(size_t capacity)
                : m_capacity(std::max<size_t>(capacity, 1)) {
            }

            LRUCache(const LRUCache&) = delete;
            LRUCache& operator=(const LRUCache&) = delete;

            /**
             * @brief Look up a key and mark it most recently used
             * @return Value if found, nullopt otherwise
             */
            [[nodiscard]] std::optional<Value> Get(const Key& key) {
                std::unique_lock<std::shared_mutex> lock(m_mutex);

                auto it = m_index.find(key);
                if (it == m_index.end()) {
                    m_missCount.fetch_add(1, std::memory_order_relaxed);
                    return std::nullopt;
                }

                m_entries.splice(m_entries.begin(), m_entries, it->second);
                m_hitCount.fetch_add(1, std::memory_order_relaxed);
                return it->second->second;
            }

            /**
             * @brief Insert or refresh an entry, evicting the least recently used on overflow
             */
            void Put(const Key& key, Value value) {
                std::unique_lock<std::shared_mutex> lock(m_mutex);

                auto it = m_index.find(key);
                if (it != m_index.end()) {
                    it->second->second = std::move(value);
                    m_entries.splice(m_entries.begin(), m_entries, it->second);
                    return;
                }

                m_entries.emplace_front(key, std::move(value));
                m_index.emplace(m_entries.front().first, m_entries.begin());

                while (m_index.size() > m_capacity) {
                    m_index.erase(m_entries.back().first);
                    m_entries.pop_back();
                    m_evictionCount.fetch_add(1, std::memory_order_relaxed);
                }
            }

            [[nodiscard]] bool Contains(const Key& key) const {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_index.find(key) != m_index.end();
            }

            void Clear() noexcept {
                std::unique_lock<std::shared_mutex> lock(m_mutex);
                m_index.clear();
                m_entries.clear();
            }

            [[nodiscard]] size_t Size() const noexcept {
                std::shared_lock<std::shared_mutex> lock(m_mutex);
                return m_index.size();
            }

            [[nodiscard]] size_t Capacity() const noexcept { return m_capacity; }
            [[nodiscard]] uint64_t HitCount() const noexcept { return m_hitCount.load(std::memory_order_relaxed); }
            [[nodiscard]] uint64_t MissCount() const noexcept { return m_missCount.load(std::memory_order_relaxed); }
            [[nodiscard]] uint64_t EvictionCount() const noexcept { return m_evictionCount.load(std::memory_order_relaxed); }

            [[nodiscard]] double HitRate() const noexcept {
                const uint64_t hits = m_hitCount.load(std::memory_order_relaxed);
                const uint64_t total = hits + m_missCount.load(std::memory_order_relaxed);
                return total > 0 ? static_cast<double>(hits) / static_cast<double>(total) : 0.0;
            }

        private:
            using Entry = std::pair<Key, Value>;
            using EntryList = std::list<Entry>;

            size_t m_capacity;
            EntryList m_entries;
            std::unordered_map<Key, typename EntryList::iterator, Hash> m_index;

            std::atomic<uint64_t> m_hitCount{ 0 };
            std::atomic<uint64_t> m_missCount{ 0 };
            std::atomic<uint64_t> m_evictionCount{ 0 };

            mutable std::shared_mutex m_mutex;
        };

} // namespace Utils
} // namespace PhishShape
