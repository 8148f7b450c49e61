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

#include "src/regcoord/coordinator/registry_response.hpp"

#include <string>
#include <utility>

#include "nlohmann/json.hpp"

auto RegistryResponse::Header(std::string const& name) const
    -> std::optional<std::string> {
    auto it = headers.find(name);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto ToRegistryErrorCode(ErrorCode code, Operation operation, bool tag_invalid)
    -> RegistryErrorCode {
    // NOLINTBEGIN(readability-magic-numbers)
    switch (code) {
        case ErrorCode::Busy:
            return {429, "TOOMANYREQUESTS"};
        case ErrorCode::NotFound:
            if (operation == Operation::ListTags) {
                return {404, "NAME_UNKNOWN"};
            }
            return {404,
                    IsManifestOperation(operation) ? "MANIFEST_UNKNOWN"
                                                   : "BLOB_UNKNOWN"};
        case ErrorCode::UpstreamUnavailable:
            return {503, "UNAVAILABLE"};
        case ErrorCode::CorruptionDetected:
            return {500, "UNKNOWN"};
        case ErrorCode::DanglingReference:
            return {400, "MANIFEST_BLOB_UNKNOWN"};
        case ErrorCode::CapacityExceeded:
            return {507, "DENIED"};
        case ErrorCode::InvalidDigest:
            return {400, "DIGEST_INVALID"};
        case ErrorCode::InvalidName:
            return {400, tag_invalid ? "TAG_INVALID" : "NAME_INVALID"};
        case ErrorCode::InvalidManifest:
            return {400, "MANIFEST_INVALID"};
        case ErrorCode::UploadUnknown:
            return {404, "BLOB_UPLOAD_UNKNOWN"};
        case ErrorCode::Unsupported:
            return {405, "UNSUPPORTED"};
        case ErrorCode::IoFailure:
            return {500, "UNKNOWN"};
    }
    return {500, "UNKNOWN"};
    // NOLINTEND(readability-magic-numbers)
}

auto RegistryResponse::FromError(Error error,
                                 Operation operation,
                                 bool tag_invalid) -> RegistryResponse {
    auto [status, code] = ToRegistryErrorCode(error.code, operation, tag_invalid);
    RegistryResponse response{};
    response.status = status;
    auto entry = nlohmann::json::object();
    entry["code"] = code;
    entry["message"] = error.message;
    auto document = nlohmann::json::object();
    document["errors"] = nlohmann::json::array();
    document["errors"].push_back(std::move(entry));
    response.body = document.dump();
    response.headers["Content-Type"] = "application/json";
    response.headers["Content-Length"] = std::to_string(response.body.size());
    if (error.code == ErrorCode::Busy) {
        response.headers["Retry-After"] =
            std::to_string(kBusyRetryAfterSeconds);
    }
    else if (error.code == ErrorCode::UpstreamUnavailable) {
        response.headers["Retry-After"] =
            std::to_string(kUnavailableRetryAfterSeconds);
    }
    response.error = std::move(error);
    return response;
}
