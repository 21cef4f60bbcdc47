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
/**
 * @file SampleRepository.hpp
 * @brief On-disk sample pool: <base>.dom byte records with <base>.meta.json
 *
 * Metadata record:
 * @code
 *   { "url": "https://...", "ts": 1700000000, "size": 1234, "label": "phish" }
 * @endcode
 */

#include "Sample.hpp"
#include "../Utils/FileUtils.hpp"

#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace PhishShape::Prototypes {

    /**
     * @brief Phishing and legitimate pools read from one mixed directory.
     */
    struct LabeledPools {
        std::vector<Sample> phishing;
        std::vector<Sample> legitimate;
        size_t skipped = 0;     ///< Records without readable metadata

        [[nodiscard]] size_t Total() const noexcept { return phishing.size() + legitimate.size(); }
    };

    /// x.dom → x.meta.json
    [[nodiscard]] std::filesystem::path MetaPathFor(const std::filesystem::path& domPath);

    /**
     * @brief Load every labeled sample in @p dir.
     *
     * Records without metadata are skipped with a warning. A missing
     * "label" key defaults to legit.
     *
     * @return false only when the directory cannot be listed
     */
    [[nodiscard]] bool LoadLabeledSamples(const std::filesystem::path& dir,
                                          LabeledPools& out,
                                          Utils::FileUtils::Error* err = nullptr);

    /**
     * @brief Load every .dom file in @p dir with a fixed label.
     *
     * Metadata is optional here; when present it supplies url and timestamp.
     * Empty records are skipped.
     */
    [[nodiscard]] bool LoadSampleDirectory(const std::filesystem::path& dir,
                                           Label label,
                                           std::vector<Sample>& out,
                                           Utils::FileUtils::Error* err = nullptr);

    /**
     * @brief Persist one capture as <ts>_<hash>.dom plus metadata.
     *
     * @return path of the written .dom file, nullopt on failure
     */
    [[nodiscard]] std::optional<std::filesystem::path> SaveSample(std::string_view url,
                                                                  std::span<const uint8_t> bytes,
                                                                  const std::filesystem::path& dir,
                                                                  std::optional<Label> label = std::nullopt,
                                                                  Utils::FileUtils::Error* err = nullptr);

    /**
     * @brief Persist one capture as <baseName>.dom plus metadata.
     *
     * The pair is written together: if the metadata cannot be written the
     * .dom file is removed again.
     */
    [[nodiscard]] std::optional<std::filesystem::path> SaveSampleAs(std::string_view baseName,
                                                                    std::string_view url,
                                                                    std::span<const uint8_t> bytes,
                                                                    const std::filesystem::path& dir,
                                                                    std::optional<Label> label = std::nullopt,
                                                                    Utils::FileUtils::Error* err = nullptr);

} // namespace PhishShape::Prototypes
