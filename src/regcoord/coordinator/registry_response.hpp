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

#ifndef INCLUDED_SRC_REGCOORD_COORDINATOR_REGISTRY_RESPONSE_HPP
#define INCLUDED_SRC_REGCOORD_COORDINATOR_REGISTRY_RESPONSE_HPP

#include <map>
#include <optional>
#include <string>

#include "src/regcoord/common/error.hpp"
#include "src/regcoord/coordinator/request.hpp"

inline constexpr auto kBusyRetryAfterSeconds = 1;
inline constexpr auto kUnavailableRetryAfterSeconds = 10;

/// \brief Registry response: HTTP status, registry headers and body. Failed
/// requests carry the registry error document as body and keep the error
/// they were created from.
struct RegistryResponse {
    int status{200};  // NOLINT
    std::map<std::string, std::string> headers;
    std::string body;
    std::optional<Error> error;

    [[nodiscard]] auto IsSuccess() const noexcept -> bool {
        return not error.has_value();
    }

    [[nodiscard]] auto IsRetryable() const noexcept -> bool {
        return error and error->IsRetryable();
    }

    [[nodiscard]] auto Header(std::string const& name) const
        -> std::optional<std::string>;

    /// \brief Response for a failed request.
    /// \param tag_invalid  Report InvalidName errors as TAG_INVALID.
    [[nodiscard]] static auto FromError(Error error,
                                        Operation operation,
                                        bool tag_invalid = false)
        -> RegistryResponse;
};

/// \brief HTTP status and registry error code of an error.
struct RegistryErrorCode {
    int status{};
    std::string code;
};

[[nodiscard]] auto ToRegistryErrorCode(ErrorCode code,
                                       Operation operation,
                                       bool tag_invalid = false)
    -> RegistryErrorCode;

#endif  // INCLUDED_SRC_REGCOORD_COORDINATOR_REGISTRY_RESPONSE_HPP
