// =============================================================================
// genoqc - Logger Module
// =============================================================================
// Asynchronous logging through Quill, shared by transfer workers, analyzer
// watchers and the command layer. The backend thread starts on first use.
//
// Usage:
//   gqc::log::init("genoqc.log", gqc::log::Level::kInfo);
//   GQC_LOG_INFO("Fetched {} bytes", bytes);
// =============================================================================

#ifndef GQC_COMMON_LOGGER_H
#define GQC_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace gqc::log {

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Append to an existing log file; resumed batches keep earlier attempts.
    bool appendToFile = true;

    /// @brief Logger name for identification.
    std::string loggerName = "genoqc";
};

/// @brief Install the configured logger.
/// @note Called once from main() before any worker thread is started. Messages
///       logged earlier went to a console fallback; later calls are ignored.
void init(const Config& config);

/// @brief Install a logger writing to the console and, when given, @p logFile.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Logger used by the GQC_LOG_* macros.
/// @note Falls back to a console logger at info level when init() was never
///       called, so library code and tests can log unconditionally.
[[nodiscard]] quill::Logger* logger();

/// @brief True once init() installed the configured logger.
[[nodiscard]] bool isConfigured() noexcept;

/// @brief Block until every message logged so far has been written.
void flush();

/// @brief Flush pending messages and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse "trace", "debug", "info", "warning"/"warn", "error" or "critical".
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name);

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace gqc::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define GQC_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define GQC_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define GQC_LOG_INFO(fmt, ...) \
    LOG_INFO(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define GQC_LOG_WARNING(fmt, ...) \
    LOG_WARNING(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define GQC_LOG_ERROR(fmt, ...) \
    LOG_ERROR(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define GQC_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(gqc::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // GQC_COMMON_LOGGER_H
