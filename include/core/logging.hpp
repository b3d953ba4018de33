#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace graft_template::logging {

/// Verbosity threshold; values match spdlog::level so they convert directly
enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/**
 * @brief Settings applied to every logger created after configure()
 *
 * File output goes to one rotating file per logger name inside
 * @c logDirectory. It is skipped when the directory is empty.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string pattern = "[%H:%M:%S.%e] %n %^%l%$: %v";
    std::size_t rotateSizeBytes = 1024 * 1024;
    std::size_t rotateFileCount = 5;
};

/**
 * @brief Parse a level name from the command line
 *
 * Accepts trace, debug, info, warn (or warning), error, critical and off
 * in any letter case.
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Owner of the process-wide logging setup
 *
 * Components obtain their logger once through create() and keep it in a
 * function-local static.
 */
class LoggerFactory {
public:
    /// Return the logger registered under @p name, creating it if needed
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    static void configure(const LogConfig& config);

    /// Change the threshold of the configuration and of every live logger
    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    /// Flush and drop all loggers; later create() calls start fresh
    static void shutdown();

private:
    static LogConfig config_;
};

}  // namespace graft_template::logging
