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

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_FILE_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_FILE_HPP

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

#ifdef __unix__
#include <sys/time.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "fmt/chrono.h"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/regcoord/logging/log_sink.hpp"
#include "src/regcoord/logging/logger.hpp"

/// \brief Sink appending timestamped lines to a file. All instances writing
/// the same canonical path share one mutex, so concurrent loggers never
/// interleave partial lines.
class LogSinkFile final : public ILogSink {
  public:
    enum class Mode : std::uint8_t {
        Append,    ///< Append if log file already exists.
        Overwrite  ///< Truncate the log file when the first sink opens it.
    };

    static auto CreateFactory(std::filesystem::path const& file_path,
                              Mode file_mode = Mode::Append) -> LogSinkFactory {
        return
            [=] { return std::make_shared<LogSinkFile>(file_path, file_mode); };
    }

    LogSinkFile(std::filesystem::path const& file_path, Mode file_mode)
        : file_path_{std::filesystem::weakly_canonical(file_path).string()} {
        auto& registry = Registry();
        std::lock_guard lock{registry.mutex};
        auto [it, inserted] = registry.files.try_emplace(file_path_);
        if (inserted and file_mode == Mode::Overwrite) {
            if (gsl::owner<FILE*> file = std::fopen(file_path_.c_str(), "w")) {
                std::fclose(file);
            }
        }
        file_mutex_ = &it->second;
    }
    ~LogSinkFile() noexcept final = default;
    LogSinkFile(LogSinkFile const&) noexcept = delete;
    LogSinkFile(LogSinkFile&&) noexcept = delete;
    auto operator=(LogSinkFile const&) noexcept -> LogSinkFile& = delete;
    auto operator=(LogSinkFile&&) noexcept -> LogSinkFile& = delete;

    void Emit(Logger const* logger,
              LogLevel level,
              std::string const& msg) const noexcept final {
        try {
            timespec ts{};
            clock_gettime(CLOCK_REALTIME, &ts);
            auto timestamp = fmt::format("{:%Y-%m-%d %H:%M:%S}.{:09}",
                                         fmt::localtime(ts.tv_sec),
                                         ts.tv_nsec);

            std::ostringstream id{};
            id << std::this_thread::get_id();

            auto prefix = fmt::format("[{}] thread:{} {}",
                                      timestamp,
                                      id.str(),
                                      LogLevelToString(level));
            if (logger != nullptr) {
                prefix = fmt::format("{} ({})", prefix, logger->Name());
            }
            prefix += ":";
            auto const* cont_prefix = "  ";

            std::lock_guard lock{*file_mutex_};
            if (gsl::owner<FILE*> file = std::fopen(file_path_.c_str(), "a")) {
                using it = std::istream_iterator<ILogSink::Line>;
                std::istringstream iss{msg};
                std::for_each(it{iss}, it{}, [&](auto const& line) {
                    fmt::print(file, "{} {}\n", prefix, line);
                    prefix = cont_prefix;
                });
                std::fclose(file);
            }
        } catch (...) {
            // a failing log file must never take down a request
        }
    }

  private:
    struct FileRegistry {
        std::mutex mutex;
        std::unordered_map<std::string, std::mutex> files;
    };

    std::string file_path_;
    std::mutex* file_mutex_{nullptr};

    [[nodiscard]] static auto Registry() noexcept -> FileRegistry& {
        static FileRegistry instance{};
        return instance;
    }
};

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_LOG_SINK_FILE_HPP
