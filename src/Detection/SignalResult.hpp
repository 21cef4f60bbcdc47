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

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace PhishShape::Detection {

    /**
     * @brief Outcome of an optional subsystem: a value, or the reason it
     *        is unavailable.
     *
     * @code
     *   auto model = LogisticPredictor::Load(path);
     *   if (!model) PS_LOG_WARN("ML", "%s", model.Reason().c_str());
     * @endcode
     */
    template <typename T>
    class SignalResult {
    public:
        [[nodiscard]] static SignalResult Ok(T value) {
            SignalResult r;
            r.m_value = std::move(value);
            return r;
        }

        [[nodiscard]] static SignalResult Unavailable(std::string reason) {
            SignalResult r;
            r.m_reason = std::move(reason);
            return r;
        }

        [[nodiscard]] bool IsOk() const noexcept { return m_value.has_value(); }
        explicit operator bool() const noexcept { return IsOk(); }

        /// @throws std::logic_error when unavailable
        [[nodiscard]] const T& Value() const& {
            if (!m_value) throw std::logic_error("SignalResult: value unavailable: " + m_reason);
            return *m_value;
        }

        [[nodiscard]] T&& Value() && {
            if (!m_value) throw std::logic_error("SignalResult: value unavailable: " + m_reason);
            return std::move(*m_value);
        }

        /// Empty when Ok
        [[nodiscard]] const std::string& Reason() const noexcept { return m_reason; }

    private:
        SignalResult() = default;

        std::optional<T> m_value;
        std::string m_reason;
    };

} // namespace PhishShape::Detection
