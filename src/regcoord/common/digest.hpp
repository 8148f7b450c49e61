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

#ifndef INCLUDED_SRC_REGCOORD_COMMON_DIGEST_HPP
#define INCLUDED_SRC_REGCOORD_COMMON_DIGEST_HPP

#include <compare>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "src/regcoord/common/error.hpp"
#include "src/regcoord/crypto/hasher.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Content digest in the form <algorithm>:<hex>, e.g.
/// "sha256:e3b0c442...". Only lower-case hex is accepted. Digests order
/// lexicographically by their string form.
class Digest final {
  public:
    /// \brief Parse an untrusted digest string.
    /// \returns the digest or an InvalidDigest error.
    [[nodiscard]] static auto Parse(std::string const& str) noexcept
        -> expected<Digest, Error>;

    /// \brief Digest of the given content.
    [[nodiscard]] static auto Compute(
        std::string const& content,
        Hasher::HashType type = Hasher::HashType::SHA256) noexcept
        -> std::optional<Digest>;

    /// \brief Digest of the content of a file.
    [[nodiscard]] static auto ComputeFile(
        std::filesystem::path const& path,
        Hasher::HashType type = Hasher::HashType::SHA256) noexcept
        -> std::optional<Digest>;

    [[nodiscard]] auto Algorithm() const noexcept -> Hasher::HashType {
        return algorithm_;
    }

    /// \brief Algorithm name as used in the string form.
    [[nodiscard]] auto AlgorithmName() const -> std::string;

    [[nodiscard]] auto Hex() const& noexcept -> std::string const& {
        return hex_;
    }

    [[nodiscard]] auto ToString() const -> std::string;

    /// \brief Check whether content hashes to this digest.
    [[nodiscard]] auto Matches(std::string const& content) const noexcept
        -> bool;

    [[nodiscard]] auto operator<=>(Digest const& other) const noexcept =
        default;
    [[nodiscard]] auto operator==(Digest const& other) const noexcept
        -> bool = default;

  private:
    // enumerator order equals lexicographic order of the algorithm names
    Hasher::HashType algorithm_{Hasher::HashType::SHA256};
    std::string hex_;

    Digest(Hasher::HashType algorithm, std::string hex) noexcept
        : algorithm_{algorithm}, hex_{std::move(hex)} {}
};

namespace std {
template <>
struct hash<Digest> {
    [[nodiscard]] auto operator()(Digest const& d) const noexcept
        -> std::size_t {
        return std::hash<std::string>{}(d.Hex());
    }
};
}  // namespace std

#endif  // INCLUDED_SRC_REGCOORD_COMMON_DIGEST_HPP
