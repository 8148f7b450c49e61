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

#include "src/regcoord/common/error.hpp"

#include "fmt/core.h"

auto ToString(ErrorCode code) noexcept -> std::string {
    switch (code) {
        case ErrorCode::Busy:
            return "Busy";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::UpstreamUnavailable:
            return "UpstreamUnavailable";
        case ErrorCode::CorruptionDetected:
            return "CorruptionDetected";
        case ErrorCode::DanglingReference:
            return "DanglingReference";
        case ErrorCode::CapacityExceeded:
            return "CapacityExceeded";
        case ErrorCode::InvalidDigest:
            return "InvalidDigest";
        case ErrorCode::InvalidName:
            return "InvalidName";
        case ErrorCode::InvalidManifest:
            return "InvalidManifest";
        case ErrorCode::UploadUnknown:
            return "UploadUnknown";
        case ErrorCode::Unsupported:
            return "Unsupported";
        case ErrorCode::IoFailure:
            return "IoFailure";
    }
    return "Unknown";
}

auto Error::ToString() const -> std::string {
    return fmt::format("{}: {}", ::ToString(code), message);
}
