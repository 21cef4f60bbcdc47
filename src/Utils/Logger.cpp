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
#include "Logger.hpp"

#include <ctime>
#include <functional>
#include <iostream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace PhishShape {
	namespace Utils {

		const char* LogLevelToString(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			}
			return "UNKNOWN";
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load(std::memory_order_acquire)) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_writeMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) m_cfg.maxQueueSize = 1;
				if (m_cfg.maxFileCount == 0) m_cfg.maxFileCount = 1;
			}
			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_stop.store(false, std::memory_order_release);

			if (m_cfg.toFile) {
				std::error_code ec;
				std::filesystem::create_directories(m_cfg.logDirectory, ec);
				if (ec) {
					std::cerr << "[Logger] Cannot create log directory "
						<< m_cfg.logDirectory.string() << ": " << ec.message() << "\n";
					m_cfg.toFile = false;
				}
			}

			if (m_cfg.async) {
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}

			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();

			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Drain whatever the worker did not reach
			std::deque<LogItem> remaining;
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				remaining.swap(m_queue);
			}
			for (const auto& item : remaining) {
				Process(item);
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
			m_currentSize = 0;
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Logging API
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return {};

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);
			if (needed < 0) {
				return std::string(fmt);
			}

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsEnabled(level)) return;

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsInitialized() || !IsEnabled(level)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			if (file) {
				item.file = std::filesystem::path(file).filename().string();
			}
			item.function = function ? function : "";
			item.line = line;
			item.tid = std::hash<std::thread::id>{}(std::this_thread::get_id());
			item.ts = std::chrono::system_clock::now();

			if (m_cfg.async) {
				Enqueue(std::move(item));
			}
			else {
				Process(item);
			}
		}

		void Logger::Flush() {
			if (m_cfg.async) {
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait_for(lock, std::chrono::seconds(5), [this] {
					return m_queue.empty() || m_stop.load(std::memory_order_acquire);
				});
			}

			std::lock_guard<std::mutex> lock(m_writeMutex);
			std::fflush(stderr);
			if (m_file) {
				std::fflush(m_file);
			}
		}

		// ============================================================================
		// Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			if (m_queue.size() >= m_cfg.maxQueueSize) {
				switch (m_cfg.bpPolicy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [this] {
						return m_queue.size() < m_cfg.maxQueueSize || m_stop.load(std::memory_order_acquire);
					});
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] {
						return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
					});
					if (m_queue.empty()) {
						return;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();
				Process(item);
			}
		}

		void Logger::Process(const LogItem& item) {
			const std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatPlain(item);

			std::lock_guard<std::mutex> lock(m_writeMutex);
			if (m_cfg.toConsole) {
				WriteConsole(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line, item.level);
			}
		}

		// ============================================================================
		// Output
		// ============================================================================

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const std::string& line, LogLevel level) {
			RotateIfNeeded(line.size() + 1);
			OpenLogFileIfNeeded();
			if (!m_file) return;

			std::fwrite(line.data(), 1, line.size(), m_file);
			std::fputc('\n', m_file);
			m_currentSize += line.size() + 1;

			if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				std::fflush(m_file);
			}
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			std::string out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601UTC(item.ts);
			out += " [";
			out += LogLevelToString(item.level);
			out += "]";
			if (m_cfg.includeThreadId) {
				out += " [tid:";
				out += std::to_string(item.tid % 100000);
				out += "]";
			}
			out += " [";
			out += item.category;
			out += "] ";
			out += item.message;
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += " (";
				out += item.file;
				out += ":";
				out += std::to_string(item.line);
				if (!item.function.empty()) {
					out += " ";
					out += item.function;
				}
				out += ")";
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			nlohmann::json j;
			j["ts"] = FormatIso8601UTC(item.ts);
			j["level"] = LogLevelToString(item.level);
			j["category"] = item.category;
			j["message"] = item.message;
			if (m_cfg.includeThreadId) {
				j["tid"] = item.tid;
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				j["file"] = item.file;
				j["line"] = item.line;
				j["function"] = item.function;
			}
			return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		// ============================================================================
		// File Rotation
		// ============================================================================

		std::filesystem::path Logger::BaseLogPath() const {
			return m_cfg.logDirectory / (m_cfg.baseFileName + ".log");
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			const auto path = BaseLogPath();
			m_file = std::fopen(path.string().c_str(), "ab");
			if (!m_file) {
				std::cerr << "[Logger] Cannot open log file " << path.string() << "\n";
				return;
			}

			std::error_code ec;
			const auto size = std::filesystem::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (!m_file) OpenLogFileIfNeeded();
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			PerformRotation();
		}

		void Logger::PerformRotation() {
			if (m_file) {
				std::fclose(m_file);
				m_file = nullptr;
			}

			const auto base = BaseLogPath();
			auto rotated = [&base](size_t index) {
				auto p = base;
				p += "." + std::to_string(index);
				return p;
			};

			std::error_code ec;
			// phishshape.log.(N-1) is the oldest kept file
			if (m_cfg.maxFileCount > 1) {
				std::filesystem::remove(rotated(m_cfg.maxFileCount - 1), ec);
				for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
					std::filesystem::rename(rotated(i - 1), rotated(i), ec);
				}
				std::filesystem::rename(base, rotated(1), ec);
			}
			else {
				std::filesystem::remove(base, ec);
			}

			m_currentSize = 0;
			OpenLogFileIfNeeded();
		}

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point tp) {
			const auto secs = std::chrono::system_clock::to_time_t(tp);
			const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
				tp.time_since_epoch()).count() % 1000;

			std::tm utc{};
#ifdef _WIN32
			gmtime_s(&utc, &secs);
#else
			gmtime_r(&secs, &utc);
#endif
			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
				utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
				utc.tm_hour, utc.tm_min, utc.tm_sec, static_cast<int>(ms));
			return buf;
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto us = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category, "Exit (" + std::to_string(us) + " us)",
				m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace PhishShape
