// =============================================================================
// genoqc - Logger Module Implementation
// =============================================================================

#include "gqc/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gqc/common/strings.h"

namespace gqc::log {

namespace {

/// @brief Logger behind the GQC_LOG_* macros; never null once logger() returned.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief init() ran with an explicit configuration.
std::atomic<bool> gConfigured{false};

std::mutex gInitMutex;

bool gBackendRunning = false;

/// @brief Name of the console logger created on first use without init().
constexpr const char* kFallbackLoggerName = "genoqc.fallback";

void startBackendLocked() {
    if (!gBackendRunning) {
        quill::BackendOptions backendOptions;
        quill::Backend::start(backendOptions);
        gBackendRunning = true;
    }
}

}  // namespace

// =============================================================================
// Level Conversion
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

std::optional<Level> levelFromString(std::string_view name) {
    const std::string lower = toLower(trim(name));
    if (lower == "trace") {
        return Level::kTrace;
    }
    if (lower == "debug") {
        return Level::kDebug;
    }
    if (lower == "info") {
        return Level::kInfo;
    }
    if (lower == "warning" || lower == "warn") {
        return Level::kWarning;
    }
    if (lower == "error") {
        return Level::kError;
    }
    if (lower == "critical") {
        return Level::kCritical;
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return "trace";
        case Level::kDebug:
            return "debug";
        case Level::kInfo:
            return "info";
        case Level::kWarning:
            return "warning";
        case Level::kError:
            return "error";
        case Level::kCritical:
            return "critical";
    }
    return "info";
}

// =============================================================================
// Initialization
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gConfigured.load(std::memory_order_acquire)) {
        return;
    }
    startBackendLocked();

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileSinkConfig;
        fileSinkConfig.set_open_mode(config.appendToFile ? 'a' : 'w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileSinkConfig, quill::FileEventNotifier{}));
    }

    // Replaces any fallback logger that early messages went to.
    quill::Logger* configured =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    configured->set_log_level(toQuillLevel(config.level));

    gLogger.store(configured, std::memory_order_release);
    gConfigured.store(true, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

// =============================================================================
// Access
// =============================================================================

quill::Logger* logger() {
    quill::Logger* current = gLogger.load(std::memory_order_acquire);
    if (current != nullptr) {
        return current;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    current = gLogger.load(std::memory_order_acquire);
    if (current == nullptr) {
        startBackendLocked();
        current = quill::Frontend::create_or_get_logger(
            kFallbackLoggerName, quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
        current->set_log_level(quill::LogLevel::Info);
        gLogger.store(current, std::memory_order_release);
    }
    return current;
}

bool isConfigured() noexcept {
    return gConfigured.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (!gBackendRunning) {
        return;
    }
    flush();
    quill::Backend::stop();
    gBackendRunning = false;
}

}  // namespace gqc::log
