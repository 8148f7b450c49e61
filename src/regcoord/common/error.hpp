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

#ifndef INCLUDED_SRC_REGCOORD_COMMON_ERROR_HPP
#define INCLUDED_SRC_REGCOORD_COMMON_ERROR_HPP

#include <cstdint>
#include <string>
#include <utility>

#include "src/utils/cpp/expected.hpp"

/// \brief Failure classes reported by the coordinator and its components.
enum class ErrorCode : std::uint8_t {
    Busy,                 ///< Lock wait timed out; retryable.
    NotFound,             ///< Key absent from store (and upstream).
    UpstreamUnavailable,  ///< Remote fetch failed after retries; retryable.
    CorruptionDetected,   ///< Digest and content disagree.
    DanglingReference,    ///< Manifest refers to a missing blob.
    CapacityExceeded,     ///< Disk or quota full; nothing was written.
    InvalidDigest,        ///< Malformed digest or content hash mismatch.
    InvalidName,          ///< Malformed repository name or tag.
    InvalidManifest,      ///< Manifest can not be parsed.
    UploadUnknown,        ///< No such upload session.
    Unsupported,          ///< Operation not offered by the facet.
    IoFailure             ///< Any other file system failure.
};

[[nodiscard]] auto ToString(ErrorCode code) noexcept -> std::string;

/// \brief Error code with a human readable message.
struct Error {
    ErrorCode code{ErrorCode::IoFailure};
    std::string message;

    /// \brief Whether the same request may succeed when repeated later.
    [[nodiscard]] auto IsRetryable() const noexcept -> bool {
        return code == ErrorCode::Busy or
               code == ErrorCode::UpstreamUnavailable;
    }

    [[nodiscard]] auto ToString() const -> std::string;
};

/// \brief Convenience to create an unexpected error in return statements.
[[nodiscard]] inline auto MakeError(ErrorCode code, std::string message)
    -> unexpected<Error> {
    return unexpected<Error>{Error{code, std::move(message)}};
}

/// \brief Acknowledgement of a content-addressed write.
struct Ack {
    bool created{};  ///< False if identical content was already stored.
};

#endif  // INCLUDED_SRC_REGCOORD_COMMON_ERROR_HPP
