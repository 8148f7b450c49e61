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

#include "src/regcoord/upstream/retry.hpp"

#include <thread>

#include "src/regcoord/logging/log_level.hpp"

void WaitBeforeRetry(RetryConfig const& config,
                     Logger const& logger,
                     std::string const& what,
                     unsigned int attempt,
                     Error const& error) noexcept {
    auto const sleep_time = config.GetSleepTime(attempt);
    logger.Emit(kRetryLogLevel,
                "Attempt {}/{} for {} failed: {}. Retrying in {} ms.",
                attempt,
                config.GetMaxAttempts(),
                what,
                error.message,
                sleep_time.count());
    std::this_thread::sleep_for(sleep_time);
}

auto RetriesExhausted(std::string const& what,
                      unsigned int attempts,
                      Error const& last_error) -> Error {
    auto const action = last_error.code == ErrorCode::UpstreamUnavailable
                            ? "unavailable upstream"
                            : "failed";
    return Error{last_error.code,
                 fmt::format("{} {} after {} attempts: {}",
                             what,
                             action,
                             attempts,
                             last_error.message)};
}
