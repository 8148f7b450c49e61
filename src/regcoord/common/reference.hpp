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

#ifndef INCLUDED_SRC_REGCOORD_COMMON_REFERENCE_HPP
#define INCLUDED_SRC_REGCOORD_COMMON_REFERENCE_HPP

#include <string>
#include <variant>

#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Maximal length of a repository name.
inline constexpr std::size_t kMaxRepositoryNameLength = 255;

/// \brief Check a repository name, e.g. "library/alpine".
/// \returns an InvalidName error if the name is malformed.
[[nodiscard]] auto ValidateRepositoryName(std::string const& name) noexcept
    -> expected<std::monostate, Error>;

/// \brief Check a tag, e.g. "3.19".
[[nodiscard]] auto ValidateTag(std::string const& tag) noexcept
    -> expected<std::monostate, Error>;

/// \brief Manifest reference as given in a request path: a tag or a digest.
using ManifestReference = std::variant<std::string, Digest>;

/// \brief Interpret a reference as digest if it contains a colon, as tag
/// otherwise, validating either form.
[[nodiscard]] auto ParseManifestReference(std::string const& reference) noexcept
    -> expected<ManifestReference, Error>;

/// \brief String form of a reference, for logging and upstream requests.
[[nodiscard]] auto ToString(ManifestReference const& reference)
    -> std::string;

#endif  // INCLUDED_SRC_REGCOORD_COMMON_REFERENCE_HPP
