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
#pragma once
/**
 * @file Logger.hpp
 * @brief Thread-safe asynchronous logging system for Arbor.
 *
 * Provides logging with:
 * - Asynchronous logging with configurable back-pressure policies
 * - Multiple output targets (console, rotating file)
 * - JSON Lines output format support
 * - Source location tracking (file, line, function)
 * - Scoped logging with timing measurements
 * - Thread-safe singleton pattern
 *
 * @note Thread-safe for all public methods.
 * @warning Macros are no-ops until Initialize() has been called.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdarg>
#include <cstdio>
#include <deque>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <string>
#include <thread>
#include <vector>

namespace Arbor {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/**
		 * @brief Severity levels for log messages.
		 *
		 * Ordered from least to most severe. Messages below the configured
		 * minimum level are discarded.
		 */
		enum class LogLevel : uint8_t {
			Trace = 0,  ///< Verbose debugging information
			Debug,      ///< Debug-level information
			Info,       ///< Informational messages
			Warn,       ///< Warning conditions
			Error,      ///< Error conditions
			Fatal       ///< Fatal/critical errors
		};

		/// @brief Upper-case name of a level ("INFO", "WARN", ...)
		[[nodiscard]] const char* LogLevelToString(LogLevel level) noexcept;

		/// @brief Parses a level name (case-insensitive). Returns false if unknown.
		[[nodiscard]] bool LogLevelFromString(const std::string& name, LogLevel& out) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		/**
		 * @brief Configuration options for the Logger.
		 */
		struct LoggerConfig {
			/// Maximum queue size for async logging
			size_t maxQueueSize = 1000;

			/// Policy when queue is full
			enum class BackPressurePolicy {
				Block,       ///< Block until space available
				DropOldest,  ///< Drop oldest messages
				DropNewest   ///< Drop newest messages
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;              ///< Enable asynchronous logging
			bool toConsole = true;          ///< Output to console (stderr)
			bool toFile = false;            ///< Output to file
			bool jsonLines = false;         ///< Use JSON Lines format
			bool useUtcTime = true;         ///< Use UTC timestamps
			bool includeSrcLocation = true; ///< Include source file/line/function
			bool includeProcThreadId = true;///< Include process/thread IDs

			std::string logDirectory = "logs";          ///< Log file directory
			std::string baseFileName = "arbor";         ///< Base log file name
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;  ///< Max file size (10MB)
			size_t maxFileCount = 10;                   ///< Max rotated files to keep

			LogLevel minimalLevel = LogLevel::Info;     ///< Minimum level to log
			LogLevel flushLevel = LogLevel::Error;      ///< Level that triggers flush
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Thread-safe singleton logger with async support.
		 *
		 * Usage:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = "logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   AR_LOG_INFO("MyCategory", "Hello %s", "World");
		 *   AR_LOG_ERROR("MyCategory", "Error code: %d", 42);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 *
		 * @note Call ShutDown() before application exit to flush pending logs.
		 */
		class Logger {
		public:
			/**
			 * @brief Get the singleton Logger instance.
			 * @return Reference to the global Logger instance
			 */
			[[nodiscard]] static Logger& Instance();

			/**
			 * @brief Initialize the logger with configuration.
			 *
			 * Calling it again replaces the configuration; the worker thread
			 * is restarted if the async mode changed.
			 *
			 * @param cfg Logger configuration
			 */
			void Initialize(const LoggerConfig& cfg);

			/**
			 * @brief Shut down the logger and flush pending messages.
			 *
			 * Stops the async worker thread and writes remaining messages.
			 */
			void ShutDown();

			/**
			 * @brief Check if logger is initialized.
			 * @return true if initialized, false otherwise
			 */
			[[nodiscard]] bool IsInitialized() const noexcept;

			/**
			 * @brief Set the minimum log level.
			 * @param level New minimum level
			 */
			void setMinimalLevel(LogLevel level) noexcept;

			/**
			 * @brief Check if a log level is enabled.
			 * @param level Level to check
			 * @return true if level would be logged
			 */
			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/**
			 * @brief Log a printf-style formatted message with source location.
			 */
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			/**
			 * @brief Log a pre-formatted message.
			 */
			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			/**
			 * @brief Flush all pending log messages.
			 */
			void Flush();

			/**
			 * @brief Format a message with va_list.
			 * @param fmt Format string
			 * @param args Variable arguments
			 * @return Formatted string
			 */
			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/**
			 * @brief RAII scope logger for function entry/exit timing.
			 */
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				// Non-copyable, non-movable
				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			// Non-copyable singleton
			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			/**
			 * @brief Internal log item structure.
			 */
			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint32_t pid = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts;
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			[[nodiscard]] bool Dequeue(LogItem& out);
			void StartWorker();
			void StopWorker();

			void Write(const LogItem& item);
			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatLine(const LogItem& item) const;
			[[nodiscard]] std::string FormatPrefix(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			[[nodiscard]] std::string FormatIso8601(std::chrono::system_clock::time_point tp) const;

			// ========================================================================
			// Member Variables
			// ========================================================================

			/// Flag indicating logger is accepting messages
			std::atomic<bool> m_accepting{ false };

			/// Initialization state
			std::atomic<bool> m_initialized{ false };

			/// Current minimum log level
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			/// Logger configuration
			LoggerConfig m_cfg{};

			/// Mutex protecting configuration and sink access
			mutable std::mutex m_cfgMutex;

			/// Log message queue for async mode
			std::deque<LogItem> m_queue;

			/// Mutex protecting queue access
			mutable std::mutex m_queueMutex;

			/// Condition variable for queue signaling
			std::condition_variable m_queueCv;

			/// Signals producers blocked by BackPressurePolicy::Block
			std::condition_variable m_spaceCv;

			/// Async worker thread
			std::thread m_worker;

			/// Stop flag for worker thread
			std::atomic<bool> m_stop{ false };

			/// Open log file (nullptr if file sink disabled or not yet opened)
			std::FILE* m_file = nullptr;

			/// Current log file size
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace Arbor

// ═══════════════════════════════════════════════════════════════════════════
// LOGGING MACROS
// ═══════════════════════════════════════════════════════════════════════════
//
// These macros provide convenient logging with automatic source location.
// They must be defined outside the namespace to work correctly with __FILE__
// and __func__.
//
// Usage:
//   AR_LOG_INFO("Category", "Message with %d format", value);
//   AR_LOG_ERROR("Category", "Error occurred: %s", errorMsg);
//   AR_LOG_SCOPE("Category");  // Logs function entry/exit with timing
//
// ═══════════════════════════════════════════════════════════════════════════

#define AR_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::Arbor::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

/// @brief Log at TRACE level
#define AR_LOG_TRACE(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

/// @brief Log at DEBUG level
#define AR_LOG_DEBUG(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

/// @brief Log at INFO level
#define AR_LOG_INFO(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

/// @brief Log at WARN level
#define AR_LOG_WARN(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

/// @brief Log at ERROR level
#define AR_LOG_ERROR(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

/// @brief Log at FATAL level
#define AR_LOG_FATAL(category, fmt, ...) AR_LOG_AT_LEVEL_(::Arbor::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define AR_LOG_CONCAT_INNER_(a, b) a##b
#define AR_LOG_CONCAT_(a, b) AR_LOG_CONCAT_INNER_(a, b)

/// @brief RAII scope logger - logs function entry and exit with timing
#define AR_LOG_SCOPE(category) \
    ::Arbor::Utils::Logger::Scope AR_LOG_CONCAT_(_ar_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
