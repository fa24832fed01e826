// =============================================================================
// oligo-codec - Logger Module
// =============================================================================
// Asynchronous logging through Quill for the codec library and oligoc.
//
// The library logs per-oligo drops and per-chunk corrections at debug level,
// encode/decode summaries at info and chunk failures at warning or error.
// Logging before init() installs a console logger at kInfo.
//
// stdout may carry a FASTA pool or decoded bytes ("-o -"); oligoc then turns
// the console sink off and messages reach only the log file, if any.
//
//   oligo::log::init({.logFile = "run.log", .level = oligo::log::Level::kDebug});
//   OLIGO_LOG_INFO("Encoded {} chunks", count);
// =============================================================================

#ifndef OLIGO_COMMON_LOGGER_H
#define OLIGO_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace oligo::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

struct Config {
    /// @brief Log file, truncated on open. Empty disables file output.
    std::string logFile;

    Level level = Level::kInfo;

    /// @brief Write to the console; off when stdout carries data.
    bool enableConsole = true;
};

/// @brief Install the global logger. Later calls are ignored.
void init(const Config& config);

/// @brief The global logger, installing the default one on first use.
[[nodiscard]] quill::Logger* logger();

[[nodiscard]] bool isInitialized() noexcept;

void setLevel(Level level);

void flush();

/// @brief Flush and stop the backend thread; init() may be called again.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse "trace" ... "critical" (also "warn", "fatal"), ignoring
///        case. Unknown names give kInfo.
[[nodiscard]] Level levelFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Level for the CLI flags: quiet wins, then one -v per step below kInfo.
[[nodiscard]] Level levelForVerbosity(int verbosity, bool quiet) noexcept;

}  // namespace oligo::log

#define OLIGO_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(oligo::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OLIGO_LOG_INFO(fmt, ...) \
    LOG_INFO(oligo::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OLIGO_LOG_WARNING(fmt, ...) \
    LOG_WARNING(oligo::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define OLIGO_LOG_ERROR(fmt, ...) \
    LOG_ERROR(oligo::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // OLIGO_COMMON_LOGGER_H
