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
#include "SampleRepository.hpp"
#include "../Utils/JSONUtils.hpp"
#include "../Utils/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace PhishShape::Prototypes {

    namespace {

        /// FNV-1a 64-bit offset basis
        constexpr uint64_t kFnv64OffsetBasis = 0xcbf29ce484222325ull;

        /// FNV-1a 64-bit prime
        constexpr uint64_t kFnv64Prime = 0x00000100000001b3ull;

        [[nodiscard]] uint64_t Fnv1a64(std::string_view text, uint64_t state = kFnv64OffsetBasis) noexcept {
            for (unsigned char c : text) {
                state ^= static_cast<uint64_t>(c);
                state *= kFnv64Prime;
            }
            return state;
        }

        [[nodiscard]] std::string BaseName(const std::filesystem::path& domPath) {
            const std::string name = domPath.filename().string();
            return name.substr(0, name.size() - kDomExtension.size());
        }

        void SetError(Utils::FileUtils::Error* err, std::string message) {
            if (err) err->message = std::move(message);
        }

        /**
         * @brief Read a .dom record and, if present, its metadata.
         *
         * @return false when the byte record itself is unreadable
         */
        [[nodiscard]] bool ReadRecord(const std::filesystem::path& domPath,
                                      Sample& sample,
                                      std::optional<Utils::JSON::Json>& meta) {
            Utils::FileUtils::Error ioErr;
            if (!Utils::FileUtils::ReadAllBytes(domPath, sample.bytes, &ioErr)) {
                PS_LOG_ERROR("Samples", "Failed to read %s: %s", domPath.string().c_str(), ioErr.message.c_str());
                return false;
            }
            sample.id = BaseName(domPath);

            meta.reset();
            const auto metaPath = MetaPathFor(domPath);
            if (!Utils::FileUtils::Exists(metaPath)) {
                return true;
            }

            Utils::JSON::Json j;
            Utils::JSON::Error jsonErr;
            if (!Utils::JSON::LoadFromFile(metaPath, j, &jsonErr)) {
                PS_LOG_WARN("Samples", "Unreadable metadata %s (line %zu): %s",
                            metaPath.string().c_str(), jsonErr.line, jsonErr.message.c_str());
                return true;
            }

            sample.url = Utils::JSON::GetOr<std::string>(j, "url", "");
            sample.timestamp = Utils::JSON::GetOr<int64_t>(j, "ts", 0);
            meta = std::move(j);
            return true;
        }

    } // anonymous namespace

    std::filesystem::path MetaPathFor(const std::filesystem::path& domPath) {
        auto meta = domPath.parent_path() / BaseName(domPath);
        meta += std::string(kMetaExtension);
        return meta;
    }

    bool LoadLabeledSamples(const std::filesystem::path& dir, LabeledPools& out, Utils::FileUtils::Error* err) {
        out = LabeledPools{};

        std::vector<std::filesystem::path> files;
        if (!Utils::FileUtils::ListFiles(dir, kDomExtension, files, err)) {
            PS_LOG_WARN("Samples", "Samples directory not readable: %s", dir.string().c_str());
            return false;
        }

        for (const auto& path : files) {
            Sample sample;
            std::optional<Utils::JSON::Json> meta;
            if (!ReadRecord(path, sample, meta)) {
                ++out.skipped;
                continue;
            }
            if (!meta) {
                PS_LOG_WARN("Samples", "Missing metadata for %s", path.filename().string().c_str());
                ++out.skipped;
                continue;
            }

            const std::string labelText = Utils::JSON::GetOr<std::string>(*meta, "label", "legit");
            const auto label = ParseLabel(labelText);
            if (!label) {
                PS_LOG_WARN("Samples", "Unknown label '%s' in %s", labelText.c_str(), path.filename().string().c_str());
                ++out.skipped;
                continue;
            }
            sample.label = *label;

            if (sample.label == Label::Phish) {
                out.phishing.push_back(std::move(sample));
            }
            else {
                out.legitimate.push_back(std::move(sample));
            }
        }

        PS_LOG_INFO("Samples", "Loaded %zu phishing and %zu legitimate samples from %s (%zu skipped)",
                    out.phishing.size(), out.legitimate.size(), dir.string().c_str(), out.skipped);
        return true;
    }

    bool LoadSampleDirectory(const std::filesystem::path& dir, Label label,
                             std::vector<Sample>& out, Utils::FileUtils::Error* err) {
        out.clear();

        std::vector<std::filesystem::path> files;
        if (!Utils::FileUtils::ListFiles(dir, kDomExtension, files, err)) {
            PS_LOG_WARN("Samples", "Sample directory not readable: %s", dir.string().c_str());
            return false;
        }

        for (const auto& path : files) {
            Sample sample;
            std::optional<Utils::JSON::Json> meta;
            if (!ReadRecord(path, sample, meta)) {
                continue;
            }
            if (sample.bytes.empty()) {
                PS_LOG_DEBUG("Samples", "Skipping empty record %s", path.filename().string().c_str());
                continue;
            }
            sample.label = label;
            out.push_back(std::move(sample));
        }

        PS_LOG_INFO("Samples", "Loaded %zu %s samples from %s", out.size(), LabelToString(label), dir.string().c_str());
        return true;
    }

    std::optional<std::filesystem::path> SaveSample(std::string_view url,
                                                    std::span<const uint8_t> bytes,
                                                    const std::filesystem::path& dir,
                                                    std::optional<Label> label,
                                                    Utils::FileUtils::Error* err) {
        const auto now = std::chrono::system_clock::now();
        const int64_t ts = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();

        const uint64_t h = Fnv1a64(std::to_string(nanos), Fnv1a64(url));
        char hex[17];
        std::snprintf(hex, sizeof(hex), "%016llx", static_cast<unsigned long long>(h));

        const std::string base = std::to_string(ts) + "_" + std::string(hex, 12);
        return SaveSampleAs(base, url, bytes, dir, label, err);
    }

    std::optional<std::filesystem::path> SaveSampleAs(std::string_view baseName,
                                                      std::string_view url,
                                                      std::span<const uint8_t> bytes,
                                                      const std::filesystem::path& dir,
                                                      std::optional<Label> label,
                                                      Utils::FileUtils::Error* err) {
        if (baseName.empty()) {
            SetError(err, "Empty sample name");
            return std::nullopt;
        }

        const int64_t ts = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        const std::string base(baseName);
        const auto domPath = dir / (base + std::string(kDomExtension));
        const auto metaPath = dir / (base + std::string(kMetaExtension));

        if (!Utils::FileUtils::WriteAllBytesAtomic(domPath, bytes.data(), bytes.size(), err)) {
            PS_LOG_ERROR("Samples", "Failed to write %s", domPath.string().c_str());
            return std::nullopt;
        }

        Utils::JSON::Json meta;
        meta["url"] = std::string(url);
        meta["ts"] = ts;
        meta["size"] = bytes.size();
        if (label) {
            meta["label"] = LabelToString(*label);
        }

        Utils::JSON::SaveOptions opt;
        opt.pretty = true;
        Utils::JSON::Error jsonErr;
        if (!Utils::JSON::SaveToFile(metaPath, meta, &jsonErr, opt)) {
            SetError(err, jsonErr.message);
            PS_LOG_ERROR("Samples", "Failed to write %s: %s", metaPath.string().c_str(), jsonErr.message.c_str());

            // A .dom without metadata would load as an unlabeled record
            Utils::FileUtils::Error removeErr;
            if (!Utils::FileUtils::RemoveFile(domPath, &removeErr)) {
                PS_LOG_WARN("Samples", "Could not remove %s: %s", domPath.string().c_str(), removeErr.message.c_str());
            }
            return std::nullopt;
        }

        PS_LOG_DEBUG("Samples", "Saved sample %s (%zu bytes)", base.c_str(), bytes.size());
        return domPath;
    }

} // namespace PhishShape::Prototypes
