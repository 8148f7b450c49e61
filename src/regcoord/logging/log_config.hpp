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

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_LOG_CONFIG_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_LOG_CONFIG_HPP

#include <algorithm>
#include <atomic>
#include <iterator>
#include <mutex>
#include <vector>

#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/log_sink.hpp"

/// \brief Process-wide logging configuration, shared by all Logger
/// instances. The entire class is thread-safe.
class LogConfig {
    struct ConfigData {
        std::mutex mutex;
        std::atomic<LogLevel> log_limit{kDefaultLogLevel};
        std::vector<ILogSink::Ptr> sinks;
    };

  public:
    static void SetLogLimit(LogLevel level) noexcept {
        Data().log_limit = level;
    }

    /// \brief Replace all configured sinks by fresh instances created from
    /// the given factories.
    static void SetSinks(std::vector<LogSinkFactory> const& factories) noexcept {
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        data.sinks.clear();
        data.sinks.reserve(factories.size());
        std::transform(factories.cbegin(),
                       factories.cend(),
                       std::back_inserter(data.sinks),
                       [](auto const& f) { return f(); });
    }

    static void AddSink(LogSinkFactory const& factory) noexcept {
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        data.sinks.push_back(factory());
    }

    [[nodiscard]] static auto LogLimit() noexcept -> LogLevel {
        return Data().log_limit;
    }

    /// \brief Get a copy of the configured sinks, safe to use without
    /// holding the configuration lock.
    [[nodiscard]] static auto Sinks() noexcept -> std::vector<ILogSink::Ptr> {
        auto& data = Data();
        std::lock_guard lock{data.mutex};
        return data.sinks;
    }

  private:
    [[nodiscard]] static auto Data() noexcept -> ConfigData& {
        static ConfigData instance{};
        return instance;
    }
};

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_LOG_CONFIG_HPP
