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

#ifndef INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_CONFIG_HPP
#define INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include "fmt/core.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr unsigned int kDefaultInitialBackoffMs{200};
inline constexpr unsigned int kDefaultMaxBackoffMs{5000};
inline constexpr unsigned int kDefaultAttempts{3};
inline constexpr auto kRetryLogLevel = LogLevel::Progress;

/// \brief Bounded exponential backoff for remote calls.
class RetryConfig final {
  public:
    class Builder;

    RetryConfig() = default;

    [[nodiscard]] auto GetMaxAttempts() const noexcept -> unsigned int {
        return attempts_;
    }

    /// \brief The waiting time is doubled at each \p attempt until it
    /// exceeds the maximal backoff. A random jitter of up to half the backoff
    /// is added so that concurrent callers do not retry in lockstep.
    [[nodiscard]] auto GetSleepTime(unsigned int attempt) const noexcept
        -> std::chrono::milliseconds {
        auto backoff = initial_backoff_ms_;
        // on the first attempt, we don't double the backoff time
        // also we do it in a for loop to avoid overflow
        for (auto x = 1U; x < attempt; ++x) {
            backoff <<= 1U;
            if (backoff >= max_backoff_ms_) {
                backoff = max_backoff_ms_;
                break;
            }
        }
        return std::chrono::milliseconds{backoff + Jitter(backoff)};
    }

  private:
    unsigned int initial_backoff_ms_ = kDefaultInitialBackoffMs;
    unsigned int max_backoff_ms_ = kDefaultMaxBackoffMs;
    unsigned int attempts_ = kDefaultAttempts;

    RetryConfig(unsigned int initial_backoff_ms,
                unsigned int max_backoff_ms,
                unsigned int attempts)
        : initial_backoff_ms_{initial_backoff_ms},
          max_backoff_ms_{max_backoff_ms},
          attempts_{attempts} {}

    using dist_type = std::uniform_int_distribution<std::mt19937::result_type>;

    [[nodiscard]] static auto Jitter(unsigned int backoff) noexcept ->
        typename dist_type::result_type {
        static std::mutex mutex;
        static std::mt19937 rng{std::random_device{}()};
        try {
            dist_type dist{0, backoff / 2U};
            std::unique_lock lock(mutex);
            return dist(rng);
        } catch (...) {
            return 0;
        }
    }
};

class RetryConfig::Builder final {
  public:
    auto SetInitialBackoffMs(std::optional<unsigned int> x) noexcept
        -> Builder& {
        initial_backoff_ms_ = x;
        return *this;
    }

    auto SetMaxBackoffMs(std::optional<unsigned int> x) noexcept -> Builder& {
        max_backoff_ms_ = x;
        return *this;
    }

    auto SetMaxAttempts(std::optional<unsigned int> x) noexcept -> Builder& {
        attempts_ = x;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<RetryConfig, std::string> {
        unsigned int initial_backoff_ms = kDefaultInitialBackoffMs;
        if (initial_backoff_ms_.has_value()) {
            if (*initial_backoff_ms_ < 1) {
                return unexpected{
                    fmt::format("Invalid initial backoff provided: {}ms.\n"
                                "Value must be strictly greater than 0.",
                                *initial_backoff_ms_)};
            }
            initial_backoff_ms = *initial_backoff_ms_;
        }

        unsigned int max_backoff_ms = kDefaultMaxBackoffMs;
        if (max_backoff_ms_.has_value()) {
            if (*max_backoff_ms_ < initial_backoff_ms) {
                return unexpected{fmt::format(
                    "Invalid max backoff provided: {}ms.\nValue must not be "
                    "smaller than the initial backoff of {}ms.",
                    *max_backoff_ms_,
                    initial_backoff_ms)};
            }
            max_backoff_ms = *max_backoff_ms_;
        }
        else {
            max_backoff_ms = std::max(max_backoff_ms, initial_backoff_ms);
        }

        unsigned int attempts = kDefaultAttempts;
        if (attempts_.has_value()) {
            if (*attempts_ < 1) {
                return unexpected{
                    fmt::format("Invalid max number of attempts provided: "
                                "{}.\nValue must be strictly greater than 0.",
                                *attempts_)};
            }
            attempts = *attempts_;
        }

        return RetryConfig(initial_backoff_ms, max_backoff_ms, attempts);
    }

  private:
    std::optional<unsigned int> initial_backoff_ms_;
    std::optional<unsigned int> max_backoff_ms_;
    std::optional<unsigned int> attempts_;
};

#endif  // INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_CONFIG_HPP
