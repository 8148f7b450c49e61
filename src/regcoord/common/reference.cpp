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

#include "src/regcoord/common/reference.hpp"

#include <exception>
#include <regex>

#include "fmt/core.h"

namespace {

[[nodiscard]] auto RepositoryNamePattern() -> std::regex const& {
    static std::regex const kPattern{
        "[a-z0-9]+(?:(?:[._]|__|-+)[a-z0-9]+)*"
        "(?:/[a-z0-9]+(?:(?:[._]|__|-+)[a-z0-9]+)*)*"};
    return kPattern;
}

[[nodiscard]] auto TagPattern() -> std::regex const& {
    static std::regex const kPattern{"[A-Za-z0-9_][A-Za-z0-9._-]{0,127}"};
    return kPattern;
}

}  // namespace

auto ValidateRepositoryName(std::string const& name) noexcept
    -> expected<std::monostate, Error> {
    try {
        if (name.empty() or name.size() > kMaxRepositoryNameLength or
            not std::regex_match(name, RepositoryNamePattern())) {
            return MakeError(ErrorCode::InvalidName,
                             fmt::format("invalid repository name {}", name));
        }
    } catch (std::exception const& e) {
        return MakeError(
            ErrorCode::InvalidName,
            fmt::format("validating repository name failed: {}", e.what()));
    }
    return std::monostate{};
}

auto ValidateTag(std::string const& tag) noexcept
    -> expected<std::monostate, Error> {
    try {
        if (not std::regex_match(tag, TagPattern())) {
            return MakeError(ErrorCode::InvalidName,
                             fmt::format("invalid tag {}", tag));
        }
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::InvalidName,
                         fmt::format("validating tag failed: {}", e.what()));
    }
    return std::monostate{};
}

auto ParseManifestReference(std::string const& reference) noexcept
    -> expected<ManifestReference, Error> {
    if (reference.find(':') != std::string::npos) {
        auto digest = Digest::Parse(reference);
        if (not digest) {
            return unexpected{digest.error()};
        }
        return ManifestReference{*digest};
    }
    auto valid = ValidateTag(reference);
    if (not valid) {
        return unexpected{valid.error()};
    }
    try {
        return ManifestReference{reference};
    } catch (std::exception const&) {
        return MakeError(ErrorCode::IoFailure, "out of memory");
    }
}

auto ToString(ManifestReference const& reference) -> std::string {
    if (auto const* digest = std::get_if<Digest>(&reference)) {
        return digest->ToString();
    }
    return std::get<std::string>(reference);
}
