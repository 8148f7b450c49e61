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

#ifndef INCLUDED_SRC_REGCOORD_COMMON_IDS_HPP
#define INCLUDED_SRC_REGCOORD_COMMON_IDS_HPP

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <thread>

#include <sys/types.h>
#include <unistd.h>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/regcoord/crypto/hasher.hpp"
#include "src/utils/cpp/hex_string.hpp"

[[nodiscard]] static auto GetNonDeterministicRandomNumber() -> unsigned int {
    std::uniform_int_distribution<unsigned int> dist{};
    std::random_device urandom{
#ifdef __unix__
        "/dev/urandom"
#endif
    };
    return dist(urandom);
}

static auto const kRandomConstant = GetNonDeterministicRandomNumber();

static void EncodeUUIDVersion4(std::string* uuid) {
    constexpr auto kVersionByte = 6UL;
    constexpr auto kVersionBits = 0x40U;  // version 4: 0100 xxxx
    constexpr auto kClearMask = 0x0fU;
    Expects(uuid->size() >= kVersionByte);
    auto& byte = uuid->at(kVersionByte);
    byte = static_cast<char>(kVersionBits |
                             (kClearMask & static_cast<std::uint8_t>(byte)));
}

static void EncodeUUIDVariant1(std::string* uuid) {
    constexpr auto kVariantByte = 8UL;
    constexpr auto kVariantBits = 0x80U;  // variant 1: 10xx xxxx
    constexpr auto kClearMask = 0x3fU;
    Expects(uuid->size() >= kVariantByte);
    auto& byte = uuid->at(kVariantByte);
    byte = static_cast<char>(kVariantBits |
                             (kClearMask & static_cast<std::uint8_t>(byte)));
}

/// \brief Create UUID version 4 from seed, mixed with a per-process random
/// number.
[[nodiscard]] static inline auto CreateUUIDVersion4(std::string const& seed)
    -> std::optional<std::string> {
    constexpr auto kRawLength = 16UL;
    constexpr auto kHexDashPos = std::array{8UL, 12UL, 16UL, 20UL};

    auto value = fmt::format("{}-{}", std::to_string(kRandomConstant), seed);
    auto digest = Hasher::HashData(Hasher::HashType::SHA256, value);
    if (not digest) {
        return std::nullopt;
    }
    auto uuid = std::move(*digest).Bytes();
    EncodeUUIDVersion4(&uuid);
    EncodeUUIDVariant1(&uuid);
    Expects(uuid.size() >= kRawLength);

    std::size_t cur{};
    std::ostringstream ss{};
    auto uuid_hex = ToHexString(uuid.substr(0, kRawLength));
    for (auto pos : kHexDashPos) {
        ss << uuid_hex.substr(cur, pos - cur) << '-';
        cur = pos;
    }
    ss << uuid_hex.substr(cur);
    Ensures(ss.str().size() == (2 * kRawLength) + kHexDashPos.size());
    return ss.str();
}

/// \brief Create a UUID unique across processes, threads and calls.
[[nodiscard]] static inline auto CreateUUID() -> std::optional<std::string> {
    static std::atomic<std::uint64_t> counter{};
    std::ostringstream seed{};
    seed << getpid() << "-" << std::this_thread::get_id() << "-"
         << counter++ << "-"
         << std::chrono::steady_clock::now().time_since_epoch().count();
    return CreateUUIDVersion4(seed.str());
}

/// \brief Check the textual form of a UUID (lower-case, 8-4-4-4-12).
[[nodiscard]] static inline auto IsUUID(std::string const& str) noexcept
    -> bool {
    constexpr auto kLength = 36UL;
    if (str.size() != kLength) {
        return false;
    }
    for (std::size_t i = 0; i < kLength; ++i) {
        bool const dash = i == 8 or i == 13 or i == 18 or i == 23;  // NOLINT
        auto c = str[i];
        if (dash ? c != '-'
                 : not((c >= '0' and c <= '9') or (c >= 'a' and c <= 'f'))) {
            return false;
        }
    }
    return true;
}

#endif  // INCLUDED_SRC_REGCOORD_COMMON_IDS_HPP
