// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file app_log_level.hpp
 * @brief User-facing log verbosity and its mapping onto both logging backends
 * @details The settings layer persists one AppLogLevel. It is applied to the
 *          spdlog loggers created by LoggerFactory and to the ecosystem
 *          logger behind the LOG_* macros so both streams stay in step.
 */

#pragma once

#include "core/logging.hpp"

#include <kcenon/common/interfaces/logger_interface.h>

#include <string>

namespace graft_template {

/**
 * @brief Application-level log levels with simplified 4-tier model.
 *
 * Levels are hierarchical: Information captures Exception + Error +
 * Information messages.
 */
enum class AppLogLevel {
    Exception = 0,    ///< Unexpected failures
    Error = 1,        ///< Rejected operations and backend errors
    Information = 2,  ///< Accepted mutations, exports, catalog loads
    Debug = 3         ///< Per-primitive rendering traces
};

inline kcenon::common::interfaces::log_level to_ecosystem_level(AppLogLevel level) {
    using kcenon::common::interfaces::log_level;
    switch (level) {
        case AppLogLevel::Exception:   return log_level::critical;
        case AppLogLevel::Error:       return log_level::warning;
        case AppLogLevel::Information: return log_level::info;
        case AppLogLevel::Debug:       return log_level::debug;
    }
    return log_level::info;
}

/**
 * @brief Convert AppLogLevel to the spdlog-backed LoggerFactory level.
 */
inline logging::LogLevel to_logger_level(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return logging::LogLevel::Critical;
        case AppLogLevel::Error:       return logging::LogLevel::Warning;
        case AppLogLevel::Information: return logging::LogLevel::Info;
        case AppLogLevel::Debug:       return logging::LogLevel::Debug;
    }
    return logging::LogLevel::Info;
}

/**
 * @brief Map a LoggerFactory level back onto the 4-tier model.
 */
inline AppLogLevel from_logger_level(logging::LogLevel level) {
    switch (level) {
        case logging::LogLevel::Critical: return AppLogLevel::Exception;
        case logging::LogLevel::Off:      return AppLogLevel::Exception;
        case logging::LogLevel::Error:    return AppLogLevel::Error;
        case logging::LogLevel::Warning:  return AppLogLevel::Error;
        case logging::LogLevel::Info:     return AppLogLevel::Information;
        case logging::LogLevel::Debug:    return AppLogLevel::Debug;
        case logging::LogLevel::Trace:    return AppLogLevel::Debug;
    }
    return AppLogLevel::Information;
}

inline std::string to_string(AppLogLevel level) {
    switch (level) {
        case AppLogLevel::Exception:   return "Exception";
        case AppLogLevel::Error:       return "Error";
        case AppLogLevel::Information: return "Information";
        case AppLogLevel::Debug:       return "Debug";
    }
    return "Information";
}

/**
 * @brief Convert integer from QSettings to AppLogLevel.
 */
inline AppLogLevel from_settings_value(int value) {
    if (value >= 0 && value <= 3) {
        return static_cast<AppLogLevel>(value);
    }
    return AppLogLevel::Information;
}

inline int to_settings_value(AppLogLevel level) {
    return static_cast<int>(level);
}

}  // namespace graft_template
