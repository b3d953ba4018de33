#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cctype>
#include <utility>
#include <vector>

namespace graft_template::logging {

LogConfig LoggerFactory::config_ = {};

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

constexpr std::array<std::pair<std::string_view, LogLevel>, 8> kLevelNames{{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warning},
    {"warning", LogLevel::Warning},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) !=
            std::tolower(static_cast<unsigned char>(rhs[i]))) {
            return false;
        }
    }
    return true;
}

// Console always; a rotating file per logger when file output is enabled
std::vector<spdlog::sink_ptr> makeSinks(const std::string& name, const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (config.enableFileLogging && !config.logDirectory.empty()) {
        const auto path = config.logDirectory / (name + ".log");
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path.string(), config.rotateSizeBytes, config.rotateFileCount));
    }

    for (auto& sink : sinks) {
        sink->set_level(toSpdlog(config.level));
    }
    return sinks;
}

}  // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    for (const auto& [text, level] : kLevelNames) {
        if (equalsIgnoreCase(name, text)) {
            return level;
        }
    }
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    if (auto registered = spdlog::get(name)) {
        return registered;
    }

    const auto sinks = makeSinks(name, config_);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(toSpdlog(config_.level));
    logger->set_pattern(config_.pattern);
    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    config_ = config;
    spdlog::set_pattern(config_.pattern);
    spdlog::set_level(toSpdlog(config_.level));
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    config_.level = level;
    const auto threshold = toSpdlog(level);
    spdlog::set_level(threshold);
    spdlog::apply_all([threshold](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(threshold);
        for (auto& sink : logger->sinks()) {
            sink->set_level(threshold);
        }
    });
}

LogLevel LoggerFactory::getGlobalLevel() {
    return config_.level;
}

void LoggerFactory::shutdown() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) { logger->flush(); });
    spdlog::drop_all();
}

}  // namespace graft_template::logging
