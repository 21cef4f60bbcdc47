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
 * PhishShape — Resource Signature
 * ============================================================================
 *
 * @file ResourceSignature.hpp
 * @brief Structural fingerprint of the resources a page loads
 *
 * Pages that build their content in script leave almost nothing in the
 * static DOM. The set of scripts, stylesheets, images and frames they
 * pull in still identifies the kit, so it stands in for the DOM.
 *
 * Normalization keeps host and path only:
 * @code
 *   https://www.cdn.example/js/app.js?v=3#x  →  cdn.example/js/app.js
 *   //cdn.example/lib.js                      →  https://cdn.example/lib.js
 *   img/logo.png  (base https://a.example/p/) →  a.example/p/img/logo.png
 *   data:image/png;base64,...                 →  (dropped)
 * @endcode
 *
 * @copyright Copyright (c) ShadowStrike Contributors
 * @license AGPL-3.0-only
 * ============================================================================
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace PhishShape::Detection {

    /**
     * @brief Components of a URI reference (RFC 3986 appendix B split).
     */
    struct UrlParts {
        std::string scheme;
        std::string authority;
        bool hasAuthority = false;
        std::string path;
        std::string query;
        std::string fragment;
    };

    [[nodiscard]] UrlParts SplitUrl(std::string_view url);

    /**
     * @brief Resolve @p reference against @p base (RFC 3986 section 5.2).
     */
    [[nodiscard]] std::string ResolveUrl(std::string_view base, std::string_view reference);

    /**
     * @brief Canonical form of one resource URL; empty when it is dropped.
     */
    [[nodiscard]] std::string NormalizeResourceUrl(std::string_view url, std::string_view baseUrl = {});

    /**
     * @brief Raw resource URLs referenced by @p html, in document order.
     *
     * script/img/iframe/video/audio/source src, link href for stylesheet
     * and resource-hint rels, url(...) inside <style> blocks.
     */
    [[nodiscard]] std::vector<std::string> ExtractResourceReferences(std::string_view html);

    /**
     * @brief Normalize, drop empties, sort, dedupe, join with single spaces.
     */
    [[nodiscard]] std::string BuildResourceSignature(const std::vector<std::string>& references,
                                                     std::string_view baseUrl = {});

    /// ExtractResourceReferences + BuildResourceSignature, as bytes
    [[nodiscard]] std::vector<uint8_t> ExtractResourceSignature(std::string_view html,
                                                                std::string_view baseUrl = {});

} // namespace PhishShape::Detection
