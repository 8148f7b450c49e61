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

#include <chrono>
#include <stdexcept>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/upstream/retry_config.hpp"
#include "src/utils/cpp/expected.hpp"

namespace {

[[nodiscard]] auto FastRetries(unsigned int attempts) -> RetryConfig {
    auto config = RetryConfig::Builder{}
                      .SetInitialBackoffMs(1)
                      .SetMaxBackoffMs(2)
                      .SetMaxAttempts(attempts)
                      .Build();
    REQUIRE(config);
    return *config;
}

}  // namespace

TEST_CASE("Retry configuration", "[retry]") {
    SECTION("defaults") {
        auto config = RetryConfig::Builder{}.Build();
        REQUIRE(config);
        CHECK(config->GetMaxAttempts() == kDefaultAttempts);
    }

    SECTION("invalid values are rejected") {
        CHECK(not RetryConfig::Builder{}.SetMaxAttempts(0).Build());
        CHECK(not RetryConfig::Builder{}.SetInitialBackoffMs(0).Build());
        CHECK(not RetryConfig::Builder{}
                      .SetInitialBackoffMs(100)
                      .SetMaxBackoffMs(50)
                      .Build());
    }

    SECTION("backoff grows up to its maximum") {
        auto config = RetryConfig::Builder{}
                          .SetInitialBackoffMs(100)
                          .SetMaxBackoffMs(400)
                          .Build();
        REQUIRE(config);
        auto first = config->GetSleepTime(1);
        CHECK(first >= std::chrono::milliseconds{100});
        CHECK(first <= std::chrono::milliseconds{150});
        auto second = config->GetSleepTime(2);
        CHECK(second >= std::chrono::milliseconds{200});
        CHECK(second <= std::chrono::milliseconds{300});
        auto capped = config->GetSleepTime(10);
        CHECK(capped >= std::chrono::milliseconds{400});
        CHECK(capped <= std::chrono::milliseconds{600});
    }
}

TEST_CASE("Calls are retried", "[retry]") {
    Logger logger{"RetryTest"};
    auto const config = FastRetries(3);
    int calls{};

    SECTION("success on the first attempt") {
        auto result = WithRetry<int>(
            [&calls]() -> expected<int, Error> { return ++calls; },
            config,
            logger,
            "first");
        REQUIRE(result);
        CHECK(*result == 1);
        CHECK(calls == 1);
    }

    SECTION("success after transient failures") {
        auto result = WithRetry<int>(
            [&calls]() -> expected<int, Error> {
                if (++calls < 3) {
                    return MakeError(ErrorCode::UpstreamUnavailable,
                                     "transient");
                }
                return calls;
            },
            config,
            logger,
            "transient");
        REQUIRE(result);
        CHECK(*result == 3);
        CHECK(calls == 3);
    }

    SECTION("attempts are bounded") {
        auto result = WithRetry<int>(
            [&calls]() -> expected<int, Error> {
                ++calls;
                return MakeError(ErrorCode::Busy, "still locked");
            },
            config,
            logger,
            "bounded");
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::Busy);
        CHECK(result.error().message.find("3 attempts") != std::string::npos);
        CHECK(calls == 3);
    }

    SECTION("exceptions count as transient failures") {
        auto result = WithRetry<int>(
            [&calls]() -> expected<int, Error> {
                if (++calls == 1) {
                    throw std::runtime_error{"connection reset"};
                }
                return calls;
            },
            config,
            logger,
            "throwing");
        REQUIRE(result);
        CHECK(calls == 2);
    }

    SECTION("errors that are not retryable stop immediately") {
        auto result = WithRetry<int>(
            [&calls]() -> expected<int, Error> {
                ++calls;
                return MakeError(ErrorCode::NotFound, "not found");
            },
            config,
            logger,
            "missing");
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::NotFound);
        CHECK(result.error().message == "not found");
        CHECK(calls == 1);
    }
}
