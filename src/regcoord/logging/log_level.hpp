// Copyright 2025 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_LOG_LEVEL_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_LOG_LEVEL_HPP

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>

#include "gsl/gsl"

enum class LogLevel : std::uint8_t {
    Error,     ///< Error messages, failed requests and fatal conditions
    Warning,   ///< Recoverable situations that should not occur
    Info,      ///< Status reports such as startup and GC summaries
    Progress,  ///< Retries, lock waits and other long-running steps
    Debug,     ///< Per-request details such as cache hits and misses
    Trace      ///< Verbose details such as lock grants and file operations
};

constexpr auto kFirstLogLevel = LogLevel::Error;
constexpr auto kLastLogLevel = LogLevel::Trace;
constexpr auto kDefaultLogLevel = LogLevel::Info;

[[nodiscard]] static inline auto ToLogLevel(
    std::underlying_type_t<LogLevel> level) -> LogLevel {
    return std::min(std::max(static_cast<LogLevel>(level), kFirstLogLevel),
                    kLastLogLevel);
}

[[nodiscard]] static inline auto LogLevelToString(LogLevel level)
    -> std::string {
    switch (level) {
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Progress:
            return "PROG";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Trace:
            return "TRACE";
    }
    Ensures(false);  // unreachable
}

/// \brief Parse a level name as written in configuration files
/// ("error", "warning", "info", "progress", "debug", "trace").
[[nodiscard]] static inline auto ParseLogLevel(std::string const& name)
    -> std::optional<LogLevel> {
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "warning") {
        return LogLevel::Warning;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "progress") {
        return LogLevel::Progress;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "trace") {
        return LogLevel::Trace;
    }
    return std::nullopt;
}

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_LOG_LEVEL_HPP
