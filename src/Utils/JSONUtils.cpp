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
#include "JSONUtils.hpp"
#include "FileUtils.hpp"

#include <cctype>

namespace PhishShape {
	namespace Utils {
		namespace JSON {

			namespace {

				void fillLineCol(std::string_view text, size_t byteOffset, size_t& line, size_t& col) noexcept {
					line = 1;
					col = 1;
					const size_t end = std::min(byteOffset, text.size());
					for (size_t i = 0; i < end; ++i) {
						if (text[i] == '\n') { ++line; col = 1; }
						else { ++col; }
					}
				}

				void setParseErr(Error* err, std::string msg, const std::filesystem::path& p,
				                 std::string_view text, size_t byteOff) {
					if (!err) return;
					err->message = std::move(msg);
					err->path = p;
					err->byteOffset = byteOff;
					fillLineCol(text, byteOff, err->line, err->column);
				}

				void setIoErr(Error* err, const std::string& what, const std::filesystem::path& p,
				              const std::string& detail = {}) {
					if (!err) return;
					err->message = detail.empty() ? what : what + ": " + detail;
					err->path = p;
					err->byteOffset = 0;
					err->line = 0;
					err->column = 0;
				}

				void stripUtf8BOM(std::string& s) noexcept {
					if (s.size() >= 3 &&
						static_cast<unsigned char>(s[0]) == 0xEF &&
						static_cast<unsigned char>(s[1]) == 0xBB &&
						static_cast<unsigned char>(s[2]) == 0xBF) {
						s.erase(0, 3);
					}
				}

				std::string escapePointerToken(std::string_view token) {
					std::string out;
					out.reserve(token.size());
					for (char c : token) {
						if (c == '~') out += "~0";
						else if (c == '/') out += "~1";
						else out.push_back(c);
					}
					return out;
				}

				bool parseText(std::string_view text, Json& out, Error* err, const ParseOptions& opt,
				               const std::filesystem::path& origin) noexcept {
					try {
						out = Json::parse(text, nullptr, opt.allowExceptions, opt.allowComments);
						if (!opt.allowExceptions && out.is_discarded()) {
							setParseErr(err, "JSON parse failed", origin, text, 0);
							return false;
						}
						return true;
					}
					catch (const nlohmann::json::parse_error& e) {
						// e.byte is 1-based
						const size_t byteOff = e.byte > 0 ? static_cast<size_t>(e.byte - 1) : 0;
						setParseErr(err, e.what(), origin, text, byteOff);
						return false;
					}
					catch (const std::exception& e) {
						setParseErr(err, e.what(), origin, text, 0);
						return false;
					}
				}

			}  // namespace

			std::string ToJsonPointer(std::string_view pathLike) noexcept {
				if (pathLike.empty()) return "/";
				if (pathLike.front() == '/') return std::string(pathLike);

				std::string pointer;
				std::string key;
				bool inBracket = false;

				auto flushKey = [&]() {
					if (key.empty()) return;
					pointer += '/';
					pointer += escapePointerToken(key);
					key.clear();
				};

				for (char c : pathLike) {
					if (inBracket) {
						if (c == ']') {
							pointer += '/';
							pointer += escapePointerToken(key);
							key.clear();
							inBracket = false;
						}
						else {
							key.push_back(c);
						}
						continue;
					}
					if (c == '.') {
						flushKey();
					}
					else if (c == '[') {
						flushKey();
						inBracket = true;
					}
					else {
						key.push_back(c);
					}
				}
				flushKey();

				return pointer.empty() ? std::string("/") : pointer;
			}

			bool Parse(std::string_view jsonText, Json& out, Error* err, const ParseOptions& opt) noexcept {
				return parseText(jsonText, out, err, opt, {});
			}

			bool Stringify(const Json& j, std::string& out, const StringifyOptions& opt) noexcept {
				try {
					const int indent = opt.pretty ? std::max(0, opt.indentSpaces) : -1;
					out = j.dump(indent, ' ', opt.ensureAscii, nlohmann::json::error_handler_t::replace);
					return true;
				}
				catch (const std::exception&) {
					return false;
				}
			}

			bool LoadFromFile(const std::filesystem::path& path, Json& out, Error* err,
			                  const ParseOptions& opt, size_t maxBytes) noexcept {
				std::error_code ec;
				const auto size = std::filesystem::file_size(path, ec);
				if (ec) {
					setIoErr(err, "Failed to get file size", path, ec.message());
					return false;
				}
				if (size > static_cast<uintmax_t>(maxBytes)) {
					setIoErr(err, "File too large", path, std::to_string(size) + " bytes");
					return false;
				}

				std::string text;
				FileUtils::Error ioErr;
				if (!FileUtils::ReadAllText(path, text, &ioErr)) {
					setIoErr(err, "Failed to read file", path, ioErr.message);
					return false;
				}
				stripUtf8BOM(text);

				return parseText(text, out, err, opt, path);
			}

			bool SaveToFile(const std::filesystem::path& path, const Json& j, Error* err, const SaveOptions& opt) noexcept {
				std::string content;
				if (!Stringify(j, content, opt)) {
					setIoErr(err, "JSON stringify failed", path);
					return false;
				}
				content.push_back('\n');

				FileUtils::Error ioErr;
				const bool ok = opt.atomicReplace
					? FileUtils::WriteAllBytesAtomic(path, content.data(), content.size(), &ioErr)
					: FileUtils::WriteAllBytes(path, content.data(), content.size(), &ioErr);
				if (!ok) {
					setIoErr(err, "Failed to write file", path, ioErr.message);
					return false;
				}
				return true;
			}

			bool Contains(const Json& j, std::string_view pathLike) noexcept {
				try {
					const auto jp = ToJsonPointer(pathLike);
					if (jp == "/") return true;
					return j.contains(nlohmann::json::json_pointer(jp));
				}
				catch (const std::exception&) {
					return false;
				}
			}

			bool RequireKeys(const Json& j, std::string_view objectPathLike,
			                 const std::vector<std::string>& requiredKeys, Error* err) noexcept {
				try {
					const auto objPtr = ToJsonPointer(objectPathLike);
					const Json* node = &j;
					if (objPtr != "/") {
						const nlohmann::json::json_pointer jp(objPtr);
						if (!j.contains(jp)) {
							if (err) err->message = "Object path not found: " + objPtr;
							return false;
						}
						node = &j.at(jp);
					}
					if (!node->is_object()) {
						if (err) err->message = "Target is not an object: " + objPtr;
						return false;
					}
					for (const auto& k : requiredKeys) {
						if (!node->contains(k)) {
							if (err) err->message = "Missing required key: " + k;
							return false;
						}
					}
					return true;
				}
				catch (const std::exception& e) {
					if (err) err->message = e.what();
					return false;
				}
			}

		}  // namespace JSON
	}  // namespace Utils
}  // namespace PhishShape
