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
#include "FileUtils.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <thread>

namespace PhishShape {
	namespace Utils {
		namespace FileUtils {

			namespace {

				void setErr(Error* err, std::string msg, const std::filesystem::path& p,
				            std::error_code ec = {}) {
					if (!err) return;
					err->message = std::move(msg) + ": " + p.string();
					if (ec) {
						err->message += " (" + ec.message() + ")";
					}
					err->code = ec;
				}

				template <typename Container>
				bool readInto(const std::filesystem::path& path, Container& out, Error* err) noexcept {
					try {
						std::ifstream ifs(path, std::ios::in | std::ios::binary);
						if (!ifs) {
							setErr(err, "Failed to open file", path);
							return false;
						}

						std::error_code ec;
						const auto size = std::filesystem::file_size(path, ec);
						if (ec) {
							setErr(err, "Failed to get file size", path, ec);
							return false;
						}

						out.resize(static_cast<size_t>(size));
						if (size > 0) {
							ifs.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size));
							if (!ifs) {
								setErr(err, "Failed to read file", path);
								return false;
							}
						}
						return true;
					}
					catch (const std::exception& e) {
						setErr(err, e.what(), path);
						return false;
					}
				}

				std::filesystem::path tempSibling(const std::filesystem::path& path) {
					static std::atomic<uint64_t> counter{ 0 };
					const auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
					auto tmp = path;
					tmp += ".tmp." + std::to_string(tid % 100000) + "." + std::to_string(counter.fetch_add(1));
					return tmp;
				}

			}  // namespace

			bool Exists(const std::filesystem::path& path) noexcept {
				std::error_code ec;
				return std::filesystem::exists(path, ec);
			}

			bool IsDirectory(const std::filesystem::path& path) noexcept {
				std::error_code ec;
				return std::filesystem::is_directory(path, ec);
			}

			bool ReadAllBytes(const std::filesystem::path& path, std::vector<uint8_t>& out, Error* err) noexcept {
				return readInto(path, out, err);
			}

			bool ReadAllText(const std::filesystem::path& path, std::string& out, Error* err) noexcept {
				return readInto(path, out, err);
			}

			bool CreateDirectories(const std::filesystem::path& dir, Error* err) noexcept {
				if (dir.empty()) return true;
				std::error_code ec;
				std::filesystem::create_directories(dir, ec);
				if (ec) {
					setErr(err, "Failed to create directory", dir, ec);
					return false;
				}
				return true;
			}

			bool RemoveFile(const std::filesystem::path& path, Error* err) noexcept {
				std::error_code ec;
				std::filesystem::remove(path, ec);
				if (ec) {
					setErr(err, "Failed to remove file", path, ec);
					return false;
				}
				return true;
			}

			bool RemoveDirectoryRecursive(const std::filesystem::path& dir, Error* err) noexcept {
				std::error_code ec;
				std::filesystem::remove_all(dir, ec);
				if (ec) {
					setErr(err, "Failed to remove directory", dir, ec);
					return false;
				}
				return true;
			}

			bool WriteAllBytes(const std::filesystem::path& path, const void* data, size_t len, Error* err) noexcept {
				try {
					if (!CreateDirectories(path.parent_path(), err)) {
						return false;
					}

					std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
					if (!ofs) {
						setErr(err, "Failed to open file for write", path);
						return false;
					}
					if (len > 0) {
						ofs.write(static_cast<const char*>(data), static_cast<std::streamsize>(len));
					}
					ofs.flush();
					if (!ofs) {
						setErr(err, "Failed to write file", path);
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					setErr(err, e.what(), path);
					return false;
				}
			}

			bool WriteAllBytesAtomic(const std::filesystem::path& path, const void* data, size_t len, Error* err) noexcept {
				try {
					const auto tmp = tempSibling(path);
					if (!WriteAllBytes(tmp, data, len, err)) {
						std::error_code ignored;
						std::filesystem::remove(tmp, ignored);
						return false;
					}

					std::error_code ec;
					std::filesystem::rename(tmp, path, ec);
					if (ec) {
						setErr(err, "Failed to rename temp file", path, ec);
						std::error_code ignored;
						std::filesystem::remove(tmp, ignored);
						return false;
					}
					return true;
				}
				catch (const std::exception& e) {
					setErr(err, e.what(), path);
					return false;
				}
			}

			bool ListFiles(const std::filesystem::path& dir, std::string_view suffix,
			               std::vector<std::filesystem::path>& out, Error* err) noexcept {
				out.clear();
				try {
					std::error_code ec;
					if (!std::filesystem::is_directory(dir, ec)) {
						setErr(err, "Not a directory", dir, ec);
						return false;
					}

					for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
						if (!it->is_regular_file(ec)) continue;
						const std::string name = it->path().filename().string();
						if (name.size() >= suffix.size() &&
							name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
							out.push_back(it->path());
						}
					}
					if (ec) {
						setErr(err, "Failed to enumerate directory", dir, ec);
						return false;
					}

					std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
						return a.filename().string() < b.filename().string();
					});
					return true;
				}
				catch (const std::exception& e) {
					setErr(err, e.what(), dir);
					return false;
				}
			}

			bool ListDirectories(const std::filesystem::path& dir,
			                     std::vector<std::filesystem::path>& out, Error* err) noexcept {
				out.clear();
				try {
					std::error_code ec;
					if (!std::filesystem::is_directory(dir, ec)) {
						setErr(err, "Not a directory", dir, ec);
						return false;
					}

					for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
						if (it->is_directory(ec)) {
							out.push_back(it->path());
						}
					}
					if (ec) {
						setErr(err, "Failed to enumerate directory", dir, ec);
						return false;
					}

					std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
						return a.filename().string() < b.filename().string();
					});
					return true;
				}
				catch (const std::exception& e) {
					setErr(err, e.what(), dir);
					return false;
				}
			}

		}  // namespace FileUtils
	}  // namespace Utils
}  // namespace PhishShape
