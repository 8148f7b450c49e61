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

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_LOGGER_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_LOGGER_HPP

#include <algorithm>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "fmt/core.h"
#include "src/regcoord/logging/log_config.hpp"
#include "src/regcoord/logging/log_sink.hpp"

/// \brief Named logger. Messages are formatted with fmt and forwarded to the
/// sinks currently configured in LogConfig, so loggers created before the
/// logging setup still reach the final sinks.
class Logger {
  public:
    using MessageCreateFunc = std::function<std::string()>;

    explicit Logger(std::string name) noexcept : name_{std::move(name)} {}

    ~Logger() noexcept = default;
    Logger(Logger const&) noexcept = delete;
    Logger(Logger&&) noexcept = delete;
    auto operator=(Logger const&) noexcept -> Logger& = delete;
    auto operator=(Logger&&) noexcept -> Logger& = delete;

    [[nodiscard]] auto Name() const& noexcept -> std::string const& {
        return name_;
    }

    /// \brief Log limit of this instance; the global limit unless
    /// overridden with SetLogLimit.
    [[nodiscard]] auto LogLimit() const noexcept -> LogLevel {
        return log_limit_.value_or(LogConfig::LogLimit());
    }

    void SetLogLimit(LogLevel level) noexcept { log_limit_ = level; }

    /// \brief Emit log message from string via this logger instance.
    template <class... T_Args>
    void Emit(LogLevel level,
              std::string const& msg,
              T_Args&&... args) const noexcept {
        if (static_cast<int>(level) <= static_cast<int>(LogLimit())) {
            FormatAndForward(this, level, msg, std::forward<T_Args>(args)...);
        }
    }

    /// \brief Emit log message from lambda via this logger instance.
    void Emit(LogLevel level,
              MessageCreateFunc const& msg_creator) const noexcept {
        if (static_cast<int>(level) <= static_cast<int>(LogLimit())) {
            FormatAndForward(this, level, msg_creator());
        }
    }

    /// \brief Log message from string without a logger name.
    template <class... T_Args>
    static void Log(LogLevel level,
                    std::string const& msg,
                    T_Args&&... args) noexcept {
        if (static_cast<int>(level) <=
            static_cast<int>(LogConfig::LogLimit())) {
            FormatAndForward(
                nullptr, level, msg, std::forward<T_Args>(args)...);
        }
    }

    /// \brief Log message from lambda without a logger name.
    static void Log(LogLevel level,
                    MessageCreateFunc const& msg_creator) noexcept {
        if (static_cast<int>(level) <=
            static_cast<int>(LogConfig::LogLimit())) {
            FormatAndForward(nullptr, level, msg_creator());
        }
    }

  private:
    std::string name_;
    std::optional<LogLevel> log_limit_;

    template <class... T_Args>
    static void FormatAndForward(Logger const* logger,
                                 LogLevel level,
                                 std::string const& msg,
                                 T_Args&&... args) noexcept {
        if constexpr (sizeof...(T_Args) == 0) {
            auto sinks = LogConfig::Sinks();
            std::for_each(sinks.cbegin(), sinks.cend(), [&](auto const& sink) {
                sink->Emit(logger, level, msg);
            });
        }
        else {
            std::string fmsg{};
            try {
                fmsg = fmt::vformat(msg, fmt::make_format_args(args...));
            } catch (std::exception const& e) {
                fmsg = fmt::format(
                    "{} (malformed log message: {})", msg, e.what());
            }
            FormatAndForward(logger, level, fmsg);
        }
    }
};

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_LOGGER_HPP
