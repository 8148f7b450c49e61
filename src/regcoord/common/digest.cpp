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

#include "src/regcoord/common/digest.hpp"

#include <exception>

#include "fmt/core.h"
#include "src/utils/cpp/hex_string.hpp"

namespace {

[[nodiscard]] auto ParseAlgorithm(std::string const& name) noexcept
    -> std::optional<Hasher::HashType> {
    if (name == "sha256") {
        return Hasher::HashType::SHA256;
    }
    if (name == "sha512") {
        return Hasher::HashType::SHA512;
    }
    return std::nullopt;
}

}  // namespace

auto Digest::Parse(std::string const& str) noexcept -> expected<Digest, Error> {
    try {
        auto pos = str.find(':');
        if (pos == std::string::npos) {
            return MakeError(ErrorCode::InvalidDigest,
                             fmt::format("digest {} lacks an algorithm", str));
        }
        auto algorithm = ParseAlgorithm(str.substr(0, pos));
        if (not algorithm) {
            return MakeError(
                ErrorCode::InvalidDigest,
                fmt::format("unsupported digest algorithm in {}", str));
        }
        auto hex = str.substr(pos + 1);
        if (hex.size() != Hasher::HexLength(*algorithm) or
            not IsLowerHexString(hex)) {
            return MakeError(
                ErrorCode::InvalidDigest,
                fmt::format("malformed hex part in digest {}", str));
        }
        return Digest{*algorithm, std::move(hex)};
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::InvalidDigest,
                         fmt::format("parsing digest failed: {}", e.what()));
    }
}

auto Digest::Compute(std::string const& content,
                     Hasher::HashType type) noexcept -> std::optional<Digest> {
    auto hash = Hasher::HashData(type, content);
    if (not hash) {
        return std::nullopt;
    }
    try {
        return Digest{type, hash->HexString()};
    } catch (std::exception const&) {
        return std::nullopt;
    }
}

auto Digest::ComputeFile(std::filesystem::path const& path,
                         Hasher::HashType type) noexcept
    -> std::optional<Digest> {
    auto hash = Hasher::HashFile(type, path);
    if (not hash) {
        return std::nullopt;
    }
    try {
        return Digest{type, hash->HexString()};
    } catch (std::exception const&) {
        return std::nullopt;
    }
}

auto Digest::AlgorithmName() const -> std::string {
    switch (algorithm_) {
        case Hasher::HashType::SHA256:
            return "sha256";
        case Hasher::HashType::SHA512:
            return "sha512";
    }
    return "unknown";
}

auto Digest::ToString() const -> std::string {
    return fmt::format("{}:{}", AlgorithmName(), hex_);
}

auto Digest::Matches(std::string const& content) const noexcept -> bool {
    auto computed = Compute(content, algorithm_);
    return computed and *computed == *this;
}
