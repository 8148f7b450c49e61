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

#ifndef INCLUDED_SRC_REGCOORD_LOCKING_LOCK_KEY_HPP
#define INCLUDED_SRC_REGCOORD_LOCKING_LOCK_KEY_HPP

#include <compare>
#include <cstdint>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/common/digest.hpp"

enum class LockMode : std::uint8_t { Shared, Exclusive };

/// \brief Key a lock is taken on. Keys order digest keys before repository
/// keys, each group lexicographically by name; this is the global order in
/// which multi-key requests are acquired.
struct LockKey {
    enum class Kind : std::uint8_t { Digest, Repository };

    Kind kind{Kind::Digest};
    std::string name;

    [[nodiscard]] static auto ForDigest(Digest const& digest) -> LockKey {
        return LockKey{Kind::Digest, digest.ToString()};
    }

    [[nodiscard]] static auto ForRepository(std::string repository)
        -> LockKey {
        return LockKey{Kind::Repository, std::move(repository)};
    }

    [[nodiscard]] auto ToString() const -> std::string {
        return fmt::format(
            "{}[{}]", kind == Kind::Digest ? "digest" : "repository", name);
    }

    [[nodiscard]] auto operator<=>(LockKey const&) const = default;
    [[nodiscard]] auto operator==(LockKey const&) const -> bool = default;
};

struct LockRequest {
    LockKey key;
    LockMode mode{LockMode::Shared};
};

#endif  // INCLUDED_SRC_REGCOORD_LOCKING_LOCK_KEY_HPP
