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
#include "ResourceSignature.hpp"
#include "../Utils/Logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <map>

namespace PhishShape::Detection {

    namespace {

        constexpr std::array<std::string_view, 5> kLinkRels{
            "stylesheet", "preload", "prefetch", "dns-prefetch", "preconnect"
        };

        [[nodiscard]] bool StartsWith(std::string_view s, std::string_view prefix) noexcept {
            return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
        }

        [[nodiscard]] std::string ToLower(std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        [[nodiscard]] std::string Trim(const std::string& s) {
            const auto first = s.find_first_not_of(" \t\r\n\f");
            if (first == std::string::npos) return {};
            const auto last = s.find_last_not_of(" \t\r\n\f");
            return s.substr(first, last - first + 1);
        }

        [[nodiscard]] std::string ReplaceAll(std::string s, std::string_view from, std::string_view to) {
            size_t pos = 0;
            while ((pos = s.find(from, pos)) != std::string::npos) {
                s.replace(pos, from.size(), to);
                pos += to.size();
            }
            return s;
        }

        /// RFC 3986 section 5.2.4
        [[nodiscard]] std::string RemoveDotSegments(std::string_view path) {
            if (path.empty()) return {};

            const bool absolute = path.front() == '/';
            if (absolute) path.remove_prefix(1);

            std::vector<std::string> segments;
            size_t start = 0;
            while (true) {
                const size_t slash = path.find('/', start);
                const bool last = slash == std::string_view::npos;
                const std::string_view seg = path.substr(start, last ? std::string_view::npos : slash - start);

                if (seg == ".") {
                    if (last) segments.emplace_back();
                }
                else if (seg == "..") {
                    if (!segments.empty()) segments.pop_back();
                    if (last) segments.emplace_back();
                }
                else {
                    segments.emplace_back(seg);
                }

                if (last) break;
                start = slash + 1;
            }

            std::string out = absolute ? "/" : "";
            for (size_t i = 0; i < segments.size(); ++i) {
                if (i > 0) out += '/';
                out += segments[i];
            }
            return out;
        }

        [[nodiscard]] std::string Compose(const UrlParts& p) {
            std::string out;
            if (!p.scheme.empty()) out += p.scheme + ":";
            if (p.hasAuthority) out += "//" + p.authority;
            out += p.path;
            if (!p.query.empty()) out += "?" + p.query;
            if (!p.fragment.empty()) out += "#" + p.fragment;
            return out;
        }

        constexpr std::array<std::string_view, 7> kResourceTags{
            "script", "link", "img", "iframe", "video", "audio", "source"
        };

        [[nodiscard]] bool IsSpace(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
        }

        [[nodiscard]] bool IsWordChar(char c) noexcept {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        }

        /// True when @p lowered has @p word at @p pos followed by a non-word character
        [[nodiscard]] bool WordAt(std::string_view lowered, size_t pos, std::string_view word) noexcept {
            if (lowered.compare(pos, word.size(), word) != 0) return false;
            const size_t after = pos + word.size();
            return after < lowered.size() && !IsWordChar(lowered[after]);
        }

        struct TagScan {
            std::map<std::string, std::string> attributes;  ///< Lower-case names; first occurrence wins
            size_t end = std::string_view::npos;             ///< Index of the closing '>'
        };

        /**
         * @brief Read attributes from @p pos up to the closing '>' of a tag.
         *
         * Quoted values are skipped with find() so their length never
         * matters. end stays npos for an unterminated tag.
         */
        [[nodiscard]] TagScan ScanAttributes(std::string_view doc, std::string_view lowered, size_t pos) {
            TagScan scan;
            const size_t n = doc.size();
            while (pos < n) {
                const char c = doc[pos];
                if (c == '>') {
                    scan.end = pos;
                    return scan;
                }
                if (IsSpace(c) || c == '/') {
                    ++pos;
                    continue;
                }

                const size_t nameStart = pos;
                while (pos < n && !IsSpace(doc[pos]) && doc[pos] != '=' && doc[pos] != '>' && doc[pos] != '/') {
                    ++pos;
                }
                if (pos == nameStart) {
                    // Stray '=' without a name
                    ++pos;
                    continue;
                }
                const std::string name(lowered.substr(nameStart, pos - nameStart));

                size_t p = pos;
                while (p < n && IsSpace(doc[p])) ++p;
                if (p >= n || doc[p] != '=') {
                    scan.attributes.emplace(name, std::string());
                    continue;
                }
                ++p;
                while (p < n && IsSpace(doc[p])) ++p;
                if (p >= n) break;

                std::string_view value;
                if (doc[p] == '"' || doc[p] == '\'') {
                    const size_t close = doc.find(doc[p], p + 1);
                    if (close == std::string_view::npos) break;
                    value = doc.substr(p + 1, close - p - 1);
                    pos = close + 1;
                }
                else {
                    size_t q = p;
                    while (q < n && !IsSpace(doc[q]) && doc[q] != '>') ++q;
                    value = doc.substr(p, q - p);
                    pos = q;
                }

                if (scan.attributes.find(name) == scan.attributes.end()) {
                    // data: payloads are never resources; keep only the scheme
                    const std::string_view kept = StartsWith(value, "data:") ? value.substr(0, 5) : value;
                    scan.attributes.emplace(name, Trim(std::string(kept)));
                }
            }
            return scan;
        }

        /// url(...) references in a style sheet body
        void ScanCssUrls(std::string_view css, std::string_view lowered, std::vector<std::string>& refs) {
            size_t pos = 0;
            while ((pos = lowered.find("url(", pos)) != std::string_view::npos) {
                size_t start = pos + 4;
                if (start < css.size() && (css[start] == '"' || css[start] == '\'')) ++start;

                const size_t stop = css.find_first_of("\"')", start);
                if (stop == std::string_view::npos) break;
                pos = stop;
                if (stop == start) continue;

                size_t close = stop;
                if (css[close] == '"' || css[close] == '\'') ++close;
                if (close < css.size() && css[close] == ')') {
                    refs.emplace_back(css.substr(start, stop - start));
                }
            }
        }

        [[nodiscard]] bool IsResourceLinkRel(const std::string& rel) {
            const std::string lowered = ToLower(rel);
            return std::any_of(kLinkRels.begin(), kLinkRels.end(), [&](std::string_view r) {
                return lowered.find(r) != std::string::npos;
            });
        }

    } // anonymous namespace

    UrlParts SplitUrl(std::string_view url) {
        UrlParts parts;

        const size_t colon = url.find_first_of(":/?#");
        if (colon != std::string_view::npos && colon > 0 && url[colon] == ':') {
            parts.scheme = std::string(url.substr(0, colon));
            url.remove_prefix(colon + 1);
        }

        if (StartsWith(url, "//")) {
            url.remove_prefix(2);
            const size_t stop = url.find_first_of("/?#");
            parts.hasAuthority = true;
            parts.authority = std::string(url.substr(0, stop));
            url.remove_prefix(stop == std::string_view::npos ? url.size() : stop);
        }

        const size_t pathEnd = url.find_first_of("?#");
        parts.path = std::string(url.substr(0, pathEnd));
        url.remove_prefix(pathEnd == std::string_view::npos ? url.size() : pathEnd);

        if (StartsWith(url, "?")) {
            const size_t hash = url.find('#');
            parts.query = std::string(url.substr(1, hash == std::string_view::npos ? std::string_view::npos : hash - 1));
            url.remove_prefix(hash == std::string_view::npos ? url.size() : hash);
        }
        if (StartsWith(url, "#")) {
            parts.fragment = std::string(url.substr(1));
        }
        return parts;
    }

    std::string ResolveUrl(std::string_view base, std::string_view reference) {
        const UrlParts r = SplitUrl(reference);
        if (!r.scheme.empty()) {
            UrlParts t = r;
            t.path = RemoveDotSegments(r.path);
            return Compose(t);
        }

        const UrlParts b = SplitUrl(base);
        UrlParts t;
        t.scheme = b.scheme;
        t.fragment = r.fragment;

        if (r.hasAuthority) {
            t.hasAuthority = true;
            t.authority = r.authority;
            t.path = RemoveDotSegments(r.path);
            t.query = r.query;
            return Compose(t);
        }

        t.hasAuthority = b.hasAuthority;
        t.authority = b.authority;

        if (r.path.empty()) {
            t.path = b.path;
            t.query = r.query.empty() ? b.query : r.query;
        }
        else if (r.path.front() == '/') {
            t.path = RemoveDotSegments(r.path);
            t.query = r.query;
        }
        else {
            std::string merged;
            if (b.hasAuthority && b.path.empty()) {
                merged = "/" + r.path;
            }
            else {
                const auto slash = b.path.rfind('/');
                merged = (slash == std::string::npos ? std::string() : b.path.substr(0, slash + 1)) + r.path;
            }
            t.path = RemoveDotSegments(merged);
            t.query = r.query;
        }
        return Compose(t);
    }

    std::string NormalizeResourceUrl(std::string_view url, std::string_view baseUrl) {
        if (url.empty() || StartsWith(url, "data:") || StartsWith(url, "blob:")) {
            return {};
        }

        std::string u(url.substr(0, url.find('?')));
        u = u.substr(0, u.find('#'));

        if (StartsWith(u, "//")) {
            return "https:" + u;
        }

        UrlParts parts = SplitUrl(u);
        if (parts.scheme.empty() && !baseUrl.empty()) {
            parts = SplitUrl(ResolveUrl(baseUrl, u));
        }

        if (!parts.authority.empty()) {
            return ReplaceAll(parts.authority, "www.", "") + parts.path;
        }
        return parts.path;
    }

    std::vector<std::string> ExtractResourceReferences(std::string_view html) {
        std::vector<std::string> refs;
        const std::string lowered = ToLower(std::string(html));

        size_t pos = 0;
        while ((pos = lowered.find('<', pos)) != std::string::npos) {
            ++pos;
            const auto tag = std::find_if(kResourceTags.begin(), kResourceTags.end(),
                                          [&](std::string_view t) { return WordAt(lowered, pos, t); });
            if (tag == kResourceTags.end()) continue;

            const TagScan scan = ScanAttributes(html, lowered, pos + tag->size());
            if (scan.end == std::string_view::npos) break;
            pos = scan.end + 1;

            const auto& attrs = scan.attributes;
            if (*tag == "link") {
                const auto href = attrs.find("href");
                const auto rel = attrs.find("rel");
                if (href != attrs.end() && rel != attrs.end() && IsResourceLinkRel(rel->second)) {
                    refs.push_back(href->second);
                }
                continue;
            }

            const auto src = attrs.find("src");
            if (src != attrs.end()) {
                refs.push_back(src->second);
            }
        }

        pos = 0;
        while ((pos = lowered.find("<style", pos)) != std::string::npos) {
            pos += 6;
            if (pos < lowered.size() && IsWordChar(lowered[pos])) continue;

            const size_t open = lowered.find('>', pos);
            if (open == std::string::npos) break;
            const size_t close = lowered.find("</style>", open + 1);
            if (close == std::string::npos) break;

            ScanCssUrls(html.substr(open + 1, close - open - 1),
                        std::string_view(lowered).substr(open + 1, close - open - 1), refs);
            pos = close + 8;
        }
        return refs;
    }

    std::string BuildResourceSignature(const std::vector<std::string>& references, std::string_view baseUrl) {
        std::vector<std::string> normalized;
        normalized.reserve(references.size());
        for (const auto& ref : references) {
            std::string n = NormalizeResourceUrl(ref, baseUrl);
            if (!n.empty()) {
                normalized.push_back(std::move(n));
            }
        }

        std::sort(normalized.begin(), normalized.end());
        normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());

        std::string signature;
        for (const auto& n : normalized) {
            if (!signature.empty()) signature += ' ';
            signature += n;
        }
        return signature;
    }

    std::vector<uint8_t> ExtractResourceSignature(std::string_view html, std::string_view baseUrl) {
        const auto refs = ExtractResourceReferences(html);
        const std::string signature = BuildResourceSignature(refs, baseUrl);
        PS_LOG_DEBUG("ResourceSig", "Resource signature: %zu references, %zu bytes", refs.size(), signature.size());
        return { signature.begin(), signature.end() };
    }

} // namespace PhishShape::Detection
