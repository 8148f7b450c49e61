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

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_CMDLINE_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_CMDLINE_HPP

#include <cstdio>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

#include "fmt/color.h"
#include "fmt/core.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/log_sink.hpp"
#include "src/regcoord/logging/logger.hpp"

/// \brief Sink writing to stderr, optionally colored and optionally
/// restricted to a stricter level than the global log limit.
class LogSinkCmdLine final : public ILogSink {
  public:
    static auto CreateFactory(bool colored = true,
                              std::optional<LogLevel> restrict_level =
                                  std::nullopt) -> LogSinkFactory {
        return [=]() {
            return std::make_shared<LogSinkCmdLine>(colored, restrict_level);
        };
    }

    explicit LogSinkCmdLine(bool colored,
                            std::optional<LogLevel> restrict_level) noexcept
        : colored_{colored}, restrict_level_{restrict_level} {}
    ~LogSinkCmdLine() noexcept final = default;
    LogSinkCmdLine(LogSinkCmdLine const&) noexcept = delete;
    LogSinkCmdLine(LogSinkCmdLine&&) noexcept = delete;
    auto operator=(LogSinkCmdLine const&) noexcept -> LogSinkCmdLine& = delete;
    auto operator=(LogSinkCmdLine&&) noexcept -> LogSinkCmdLine& = delete;

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        static std::mutex mutex{};

        if (restrict_level_ and
            (static_cast<int>(*restrict_level_) < static_cast<int>(level))) {
            return;
        }

        try {
            auto prefix = LogLevelToString(level);
            if (logger != nullptr) {
                prefix = fmt::format("{} ({})", prefix, logger->Name());
            }
            prefix += ":";
            auto cont_prefix = std::string(prefix.size(), ' ');
            prefix = Colorize(level, prefix);

            std::lock_guard lock{mutex};
            using it = std::istream_iterator<ILogSink::Line>;
            std::istringstream iss{msg};
            std::for_each(it{iss}, it{}, [&](auto const& line) {
                fmt::print(stderr, "{} {}\n", prefix, line);
                prefix = cont_prefix;
            });
            std::fflush(stderr);
        } catch (...) {
            // nothing sensible left to report to
        }
    }

  private:
    bool colored_{};
    std::optional<LogLevel> restrict_level_{};

    [[nodiscard]] auto Colorize(LogLevel level, std::string const& prefix)
        const -> std::string {
        if (not colored_) {
            return prefix;
        }
        fmt::text_style style{};
        switch (level) {
            case LogLevel::Error:
                style = fg(fmt::color::red);
                break;
            case LogLevel::Warning:
                style = fg(fmt::color::orange);
                break;
            case LogLevel::Info:
                style = fg(fmt::color::lime_green);
                break;
            case LogLevel::Progress:
                style = fg(fmt::color::dark_green);
                break;
            case LogLevel::Debug:
                style = fg(fmt::color::sky_blue);
                break;
            case LogLevel::Trace:
                style = fg(fmt::color::deep_sky_blue);
                break;
        }
        return fmt::format(style, "{}", prefix);
    }
};

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_CMDLINE_HPP
