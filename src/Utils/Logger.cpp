/*
 * Arbor - Nested Sets Tree Storage
 * Copyright (C) 2026 Arbor Contributors
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

#include <algorithm>
#include <cctype>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace Arbor {
	namespace Utils {

		namespace {
			namespace fs = std::filesystem;

			uint64_t CurrentThreadId() {
				return static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			}

			const char* BaseName(const char* path) {
				if (!path) return "";
				const char* slash = std::strrchr(path, '/');
				return slash ? slash + 1 : path;
			}
		} // anonymous namespace

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

		bool LogLevelFromString(const std::string& name, LogLevel& out) noexcept {
			std::string upper(name);
			std::transform(upper.begin(), upper.end(), upper.begin(),
				[](unsigned char c) { return static_cast<char>(std::toupper(c)); });

			if (upper == "TRACE") { out = LogLevel::Trace; return true; }
			if (upper == "DEBUG") { out = LogLevel::Debug; return true; }
			if (upper == "INFO")  { out = LogLevel::Info;  return true; }
			if (upper == "WARN" || upper == "WARNING") { out = LogLevel::Warn; return true; }
			if (upper == "ERROR") { out = LogLevel::Error; return true; }
			if (upper == "FATAL") { out = LogLevel::Fatal; return true; }
			return false;
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
			// Drain and stop any previous worker before swapping configuration
			StopWorker();

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				if (m_file) {
					std::fclose(m_file);
					m_file = nullptr;
				}
				m_cfg = cfg;
				m_currentSize = 0;
			}

			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);
			m_stop.store(false, std::memory_order_release);

			if (cfg.async) {
				StartWorker();
			}

			m_accepting.store(true, std::memory_order_release);
			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}
			m_accepting.store(false, std::memory_order_release);

			StopWorker();

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >=
				static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		void Logger::StartWorker() {
			m_worker = std::thread(&Logger::WorkerLoop, this);
		}

		void Logger::StopWorker() {
			m_stop.store(true, std::memory_order_release);
			m_queueCv.notify_all();
			m_spaceCv.notify_all();
			if (m_worker.joinable()) {
				m_worker.join();
			}

			// Write whatever the worker did not get to
			LogItem item;
			while (Dequeue(item)) {
				Write(item);
			}
		}

		// ============================================================================
		// Logging Entry Points
		// ============================================================================

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsEnabled(level) || !format) return;

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
			if (!m_accepting.load(std::memory_order_acquire) || !IsEnabled(level)) return;

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = BaseName(file);
			item.function = function ? function : "";
			item.line = line;
			item.pid = static_cast<uint32_t>(::getpid());
			item.tid = CurrentThreadId();
			item.ts = std::chrono::system_clock::now();

			bool async = false;
			LogLevel flushLevel = LogLevel::Error;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
				flushLevel = m_cfg.flushLevel;
			}

			if (async && m_worker.joinable()) {
				Enqueue(std::move(item));
				if (static_cast<uint8_t>(level) >= static_cast<uint8_t>(flushLevel)) {
					Flush();
				}
			}
			else {
				Write(item);
			}
		}

		void Logger::Flush() {
			{
				std::unique_lock<std::mutex> lock(m_queueMutex);
				// Let the worker drain; bounded wait so a stalled sink never hangs callers
				m_spaceCv.wait_for(lock, std::chrono::seconds(2), [this] {
					return m_queue.empty() || m_stop.load(std::memory_order_acquire);
				});
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::fflush(stderr);
		}

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) return std::string();

			va_list copy;
			va_copy(copy, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
			va_end(copy);

			if (needed <= 0) return std::string();

			std::string out(static_cast<size_t>(needed) + 1, '\0');
			std::vsnprintf(out.data(), out.size(), fmt, args);
			out.resize(static_cast<size_t>(needed));
			return out;
		}

		// ============================================================================
		// Queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			size_t maxQueue = 0;
			LoggerConfig::BackPressurePolicy policy = LoggerConfig::BackPressurePolicy::DropOldest;
			{
				std::lock_guard<std::mutex> cfgLock(m_cfgMutex);
				maxQueue = m_cfg.maxQueueSize;
				policy = m_cfg.bpPolicy;
			}

			if (maxQueue > 0 && m_queue.size() >= maxQueue) {
				switch (policy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [this, maxQueue] {
						return m_queue.size() < maxQueue || m_stop.load(std::memory_order_acquire);
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
			m_queueCv.notify_one();
		}

		bool Logger::Dequeue(LogItem& out) {
			std::lock_guard<std::mutex> lock(m_queueMutex);
			if (m_queue.empty()) return false;
			out = std::move(m_queue.front());
			m_queue.pop_front();
			m_spaceCv.notify_all();
			return true;
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
						m_spaceCv.notify_all();
						return;
					}

					item = std::move(m_queue.front());
					m_queue.pop_front();
				}
				m_spaceCv.notify_all();

				Write(item);
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			const std::string line = FormatLine(item);

			bool toConsole = false;
			bool toFile = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				toConsole = m_cfg.toConsole;
				toFile = m_cfg.toFile;
			}

			if (toConsole) WriteConsole(line);
			if (toFile) WriteFile(line);
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			std::lock_guard<std::mutex> lock(m_cfgMutex);

			RotateIfNeeded(line.size() + 1);
			OpenLogFileIfNeeded();
			if (!m_file) return;

			std::fwrite(line.data(), 1, line.size(), m_file);
			std::fputc('\n', m_file);
			m_currentSize += line.size() + 1;
		}

		std::string Logger::BaseLogPath() const {
			fs::path p(m_cfg.logDirectory);
			p /= m_cfg.baseFileName + ".log";
			return p.string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) return;

			std::error_code ec;
			fs::create_directories(m_cfg.logDirectory, ec);

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] cannot open log file %s\n", path.c_str());
				return;
			}

			m_currentSize = static_cast<uint64_t>(fs::file_size(path, ec));
			if (ec) m_currentSize = 0;
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0) return;
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) return;
			if (!m_file) return;

			PerformRotation();
		}

		// arbor.log -> arbor.1.log -> arbor.2.log ... oldest beyond maxFileCount is removed
		void Logger::PerformRotation() {
			std::fclose(m_file);
			m_file = nullptr;
			m_currentSize = 0;

			const fs::path dir(m_cfg.logDirectory);
			auto rotated = [&](size_t index) {
				return dir / (m_cfg.baseFileName + "." + std::to_string(index) + ".log");
			};

			std::error_code ec;
			if (m_cfg.maxFileCount > 1) {
				fs::remove(rotated(m_cfg.maxFileCount - 1), ec);
				for (size_t i = m_cfg.maxFileCount - 1; i > 1; --i) {
					if (fs::exists(rotated(i - 1), ec)) {
						fs::rename(rotated(i - 1), rotated(i), ec);
					}
				}
				fs::rename(BaseLogPath(), rotated(1), ec);
			}
			else {
				fs::remove(BaseLogPath(), ec);
			}
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatLine(const LogItem& item) const {
			bool json = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				json = m_cfg.jsonLines;
			}
			return json ? FormatAsJson(item) : FormatPrefix(item) + item.message;
		}

		std::string Logger::FormatIso8601(std::chrono::system_clock::time_point tp) const {
			const std::time_t t = std::chrono::system_clock::to_time_t(tp);
			const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
				tp.time_since_epoch()).count() % 1000;

			std::tm tmv{};
			if (m_cfg.useUtcTime) {
				gmtime_r(&t, &tmv);
			}
			else {
				localtime_r(&t, &tmv);
			}

			std::ostringstream oss;
			oss << std::put_time(&tmv, "%Y-%m-%dT%H:%M:%S")
				<< '.' << std::setw(3) << std::setfill('0') << ms;
			if (m_cfg.useUtcTime) oss << 'Z';
			return oss.str();
		}

		std::string Logger::FormatPrefix(const LogItem& item) const {
			std::ostringstream oss;
			oss << FormatIso8601(item.ts) << " [" << LogLevelToString(item.level) << "]";
			if (m_cfg.includeProcThreadId) {
				oss << " [" << item.pid << ':' << item.tid << ']';
			}
			if (!item.category.empty()) {
				oss << " [" << item.category << ']';
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				oss << " (" << item.file << ':' << item.line;
				if (!item.function.empty()) oss << ' ' << item.function;
				oss << ')';
			}
			oss << ' ';
			return oss.str();
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::ostringstream oss;
			oss << "{\"ts\":\"" << FormatIso8601(item.ts) << "\""
				<< ",\"level\":\"" << LogLevelToString(item.level) << "\""
				<< ",\"category\":\"" << EscapeJson(item.category) << "\"";
			if (m_cfg.includeProcThreadId) {
				oss << ",\"pid\":" << item.pid << ",\"tid\":" << item.tid;
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				oss << ",\"file\":\"" << EscapeJson(item.file) << "\""
					<< ",\"line\":" << item.line
					<< ",\"function\":\"" << EscapeJson(item.function) << "\"";
			}
			oss << ",\"message\":\"" << EscapeJson(item.message) << "\"}";
			return oss.str();
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (const char ch : s) {
				const auto c = static_cast<unsigned char>(ch);
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\b': out += "\\b"; break;
				case '\f': out += "\\f"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (c < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", c);
						out += buf;
					}
					else {
						out += ch;
					}
				}
			}
			return out;
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
			, m_level(level)
		{
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category, messageOnEnter ? messageOnEnter : "Enter",
					m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) return;

			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();

			lg.LogMessage(m_level, m_category,
				"Exit (" + std::to_string(elapsed) + " us)",
				m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace Arbor
