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

#ifndef INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_HPP
#define INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_HPP

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/upstream/retry_config.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Sleep the backoff of a failed attempt, reporting the failure.
void WaitBeforeRetry(RetryConfig const& config,
                     Logger const& logger,
                     std::string const& what,
                     unsigned int attempt,
                     Error const& error) noexcept;

/// \brief Error reported once all attempts failed. The code of the last
/// failure is kept, so callers can still tell a busy store from an
/// unreachable upstream.
[[nodiscard]] auto RetriesExhausted(std::string const& what,
                                    unsigned int attempts,
                                    Error const& last_error) -> Error;

/// \brief Call fetch until it succeeds, fails with an error that is not
/// retryable, or the configured attempts are used up. Exceptions escaping
/// fetch count as an unavailable upstream.
template <class T>
[[nodiscard]] auto WithRetry(
    std::function<expected<T, Error>()> const& fetch,
    RetryConfig const& config,
    Logger const& logger,
    std::string const& what) noexcept -> expected<T, Error> {
    auto const attempts = config.GetMaxAttempts();
    Error last_error{ErrorCode::UpstreamUnavailable, "no attempt made"};
    for (auto attempt = 1U; attempt <= attempts; ++attempt) {
        try {
            auto result = fetch();
            if (result or not result.error().IsRetryable()) {
                return result;
            }
            last_error = std::move(result).error();
        } catch (std::exception const& e) {
            last_error = Error{ErrorCode::UpstreamUnavailable, e.what()};
        }
        if (attempt < attempts) {
            WaitBeforeRetry(config, logger, what, attempt, last_error);
        }
    }
    try {
        return unexpected{RetriesExhausted(what, attempts, last_error)};
    } catch (std::exception const&) {
        return unexpected{std::move(last_error)};
    }
}

#endif  // INCLUDED_SRC_REGCOORD_UPSTREAM_RETRY_HPP
