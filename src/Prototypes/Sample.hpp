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

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace PhishShape::Prototypes {

    /// File extension of a byte-sequence record
    inline constexpr std::string_view kDomExtension = ".dom";

    /// File extension of the metadata record that accompanies it
    inline constexpr std::string_view kMetaExtension = ".meta.json";

    enum class Label : uint8_t {
        Phish,
        Legit
    };

    [[nodiscard]] constexpr const char* LabelToString(Label label) noexcept {
        return label == Label::Phish ? "phish" : "legit";
    }

    /**
     * @brief Parse "phish"/"legit" and the common long spellings.
     */
    [[nodiscard]] inline std::optional<Label> ParseLabel(std::string_view text) noexcept {
        if (text == "phish" || text == "phishing") return Label::Phish;
        if (text == "legit" || text == "legitimate") return Label::Legit;
        return std::nullopt;
    }

    /**
     * @brief One labeled observation from the sample pool.
     */
    struct Sample {
        std::string id;                 ///< File base name without extension
        std::vector<uint8_t> bytes;     ///< Sanitized DOM or resource signature
        Label label = Label::Legit;
        std::string url;                ///< Originating URL, may be empty
        int64_t timestamp = 0;          ///< Capture time (unix seconds), 0 if unknown

        [[nodiscard]] std::span<const uint8_t> View() const noexcept {
            return { bytes.data(), bytes.size() };
        }
    };

} // namespace PhishShape::Prototypes
