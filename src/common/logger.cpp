// =============================================================================
// oligo-codec - Logger Module Implementation
// =============================================================================

#include "oligo/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <quill/sinks/NullSink.h>

namespace oligo::log {

namespace {

struct LevelName {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

// Canonical names first; aliases after them so levelToString finds the
// canonical spelling.
constexpr std::array<LevelName, 8> kLevelNames{{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
    {Level::kWarning, "warn", quill::LogLevel::Warning},
    {Level::kCritical, "fatal", quill::LogLevel::Critical},
}};

std::atomic<quill::Logger*> gLogger{nullptr};
std::mutex gInitMutex;

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.enableConsole) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));
    }

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    // stdout may carry pool or file data; with the console off and no file,
    // messages are discarded rather than mixed into it
    if (sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::NullSink>("null"));
    }
    return sinks;
}

/// @brief Start the backend and create the logger. Caller holds gInitMutex.
quill::Logger* createLocked(const Config& config) {
    if (quill::Logger* existing = gLogger.load(std::memory_order_acquire)) {
        return existing;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger("oligo", makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
    return created;
}

}  // namespace

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.quillLevel;
        }
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view name) noexcept {
    auto equalsIgnoreCase = [name](std::string_view candidate) {
        return std::equal(name.begin(), name.end(), candidate.begin(), candidate.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    };
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name)) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

Level levelForVerbosity(int verbosity, bool quiet) noexcept {
    if (quiet) {
        return Level::kError;
    }
    if (verbosity >= 2) {
        return Level::kTrace;
    }
    return verbosity == 1 ? Level::kDebug : Level::kInfo;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    createLocked(config);
}

quill::Logger* logger() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        return current;
    }
    std::lock_guard<std::mutex> lock(gInitMutex);
    return createLocked(Config{});
}

bool isInitialized() noexcept {
    return gLogger.load(std::memory_order_acquire) != nullptr;
}

void setLevel(Level level) {
    logger()->set_log_level(toQuillLevel(level));
}

void flush() {
    if (quill::Logger* current = gLogger.load(std::memory_order_acquire)) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace oligo::log
