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
 * @file JSONUtils.hpp
 * @brief JSON parsing, serialization and file helpers for PhishShape.
 *
 * Used for detection configuration, sample and prototype metadata records,
 * exported model parameters and result serialization.
 *
 * - Parsing with comment support and line/column error reporting
 * - File I/O with atomic write support
 * - JSON Pointer and dot/bracket path navigation
 *
 * Implementation uses nlohmann/json.
 *
 * @note All functions are noexcept and return success/failure status.
 */

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace PhishShape {
	namespace Utils {
		namespace JSON {

			/// @brief Type alias for nlohmann::json
			using Json = nlohmann::json;

			/// Default file size limit for LoadFromFile (32MB)
			inline constexpr size_t DEFAULT_MAX_FILE_SIZE = 32ULL * 1024 * 1024;

			// ============================================================================
			// Error Handling
			// ============================================================================

			/**
			 * @brief Error information structure for JSON operations.
			 *
			 * Captures file path, byte offset, and approximate line/column for
			 * parse errors.
			 */
			struct Error {
				std::string message;              ///< Human-readable error description
				std::filesystem::path path;       ///< File path (if applicable)
				size_t byteOffset = 0;            ///< Byte offset in JSON text (0 = unknown)
				size_t line = 0;                  ///< Approximate line number (1-based, 0 = unknown)
				size_t column = 0;                ///< Approximate column number (1-based, 0 = unknown)

				[[nodiscard]] bool hasError() const noexcept {
					return !message.empty();
				}

				void clear() noexcept {
					message.clear();
					path.clear();
					byteOffset = 0;
					line = 0;
					column = 0;
				}
			};

			// ============================================================================
			// Parse/Stringify Options
			// ============================================================================

			struct ParseOptions {
				bool allowComments = true;         ///< Allow // and /* */ comments
				bool allowExceptions = true;       ///< Parse errors carry byte offsets
			};

			struct StringifyOptions {
				bool pretty = false;               ///< Enable pretty printing with indentation
				int indentSpaces = 2;              ///< Number of spaces per indent level
				bool ensureAscii = false;          ///< Escape non-ASCII characters
			};

			struct SaveOptions : StringifyOptions {
				bool atomicReplace = true;         ///< Write to a temp file then rename
			};

			// ============================================================================
			// Text and File Functions
			// ============================================================================

			/**
			 * @brief Parse JSON text into a Json object.
			 * @return true on success; on failure @p err carries line/column
			 */
			[[nodiscard]] bool Parse(std::string_view jsonText, Json& out, Error* err = nullptr,
			                         const ParseOptions& opt = {}) noexcept;

			[[nodiscard]] bool Stringify(const Json& j, std::string& out,
			                             const StringifyOptions& opt = {}) noexcept;

			/**
			 * @brief Load and parse a JSON file.
			 *
			 * Strips a leading UTF-8 BOM. Files larger than @p maxBytes are rejected.
			 */
			[[nodiscard]] bool LoadFromFile(const std::filesystem::path& path, Json& out,
			                                Error* err = nullptr, const ParseOptions& opt = {},
			                                size_t maxBytes = DEFAULT_MAX_FILE_SIZE) noexcept;

			/**
			 * @brief Serialize and write a JSON file, creating parent directories.
			 */
			[[nodiscard]] bool SaveToFile(const std::filesystem::path& path, const Json& j,
			                              Error* err = nullptr, const SaveOptions& opt = {}) noexcept;

			// ============================================================================
			// Path Navigation
			// ============================================================================

			/**
			 * @brief Convert dot/bracket notation to a JSON Pointer.
			 *
			 * "scaler.mean[0]" becomes "/scaler/mean/0". Strings that already
			 * start with '/' are returned unchanged.
			 */
			[[nodiscard]] std::string ToJsonPointer(std::string_view pathLike) noexcept;

			[[nodiscard]] bool Contains(const Json& j, std::string_view pathLike) noexcept;

			/**
			 * @brief Get typed value from Json using path.
			 *
			 * @param out Output value (unchanged on failure)
			 * @return true if path exists and conversion succeeded
			 */
			template <typename T>
			[[nodiscard]] bool Get(const Json& j, std::string_view pathLike, T& out) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);

					if (jp == "/") {
						out = j.template get<T>();
						return true;
					}

					const nlohmann::json::json_pointer ptr(jp);
					if (!j.contains(ptr)) {
						return false;
					}
					out = j.at(ptr).template get<T>();
					return true;
				}
				catch (const std::exception&) {
					return false;
				}
			}

			/**
			 * @brief Get typed value or return default.
			 */
			template <typename T>
			[[nodiscard]] T GetOr(const Json& j, std::string_view pathLike, T defaultValue) noexcept {
				T val{};
				if (Get<T>(j, pathLike, val)) {
					return val;
				}
				return defaultValue;
			}

			/**
			 * @brief Validate that required keys exist in an object.
			 *
			 * @param objectPathLike Path to the object (use "/" for root)
			 */
			[[nodiscard]] bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                               const std::vector<std::string>& requiredKeys,
			                               Error* err = nullptr) noexcept;

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PhishShape
