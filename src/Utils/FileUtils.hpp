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
 * @file FileUtils.hpp
 * @brief File system helpers for sample and prototype persistence.
 *
 * All functions report failures through the optional Error out-parameter
 * instead of throwing.
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace PhishShape {
	namespace Utils {
		namespace FileUtils {

			/**
			 * @brief Error information for file operations.
			 */
			struct Error {
				std::string message;        ///< Human-readable error description
				std::error_code code;       ///< Underlying system error (if any)

				[[nodiscard]] bool hasError() const noexcept { return !message.empty(); }
			};

			[[nodiscard]] bool Exists(const std::filesystem::path& path) noexcept;

			[[nodiscard]] bool IsDirectory(const std::filesystem::path& path) noexcept;

			[[nodiscard]] bool ReadAllBytes(const std::filesystem::path& path, std::vector<uint8_t>& out,
			                                Error* err = nullptr) noexcept;

			[[nodiscard]] bool ReadAllText(const std::filesystem::path& path, std::string& out,
			                               Error* err = nullptr) noexcept;

			/**
			 * @brief Write a buffer, creating parent directories.
			 */
			[[nodiscard]] bool WriteAllBytes(const std::filesystem::path& path, const void* data, size_t len,
			                                 Error* err = nullptr) noexcept;

			/**
			 * @brief Write a buffer through a sibling temp file and rename.
			 *
			 * Readers never observe a partially written file.
			 */
			[[nodiscard]] bool WriteAllBytesAtomic(const std::filesystem::path& path, const void* data, size_t len,
			                                       Error* err = nullptr) noexcept;

			[[nodiscard]] bool CreateDirectories(const std::filesystem::path& dir, Error* err = nullptr) noexcept;

			/// Remove one file; a missing file is not an error
			[[nodiscard]] bool RemoveFile(const std::filesystem::path& path, Error* err = nullptr) noexcept;

			/// Remove a directory tree; a missing directory is not an error
			[[nodiscard]] bool RemoveDirectoryRecursive(const std::filesystem::path& dir, Error* err = nullptr) noexcept;

			/**
			 * @brief List regular files in @p dir whose name ends with @p suffix.
			 *
			 * Not recursive. Results are sorted by file name so repeated loads
			 * of the same directory produce the same order.
			 */
			[[nodiscard]] bool ListFiles(const std::filesystem::path& dir, std::string_view suffix,
			                             std::vector<std::filesystem::path>& out, Error* err = nullptr) noexcept;

			/**
			 * @brief List immediate subdirectories of @p dir, sorted by name.
			 */
			[[nodiscard]] bool ListDirectories(const std::filesystem::path& dir,
			                                   std::vector<std::filesystem::path>& out, Error* err = nullptr) noexcept;

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace PhishShape
