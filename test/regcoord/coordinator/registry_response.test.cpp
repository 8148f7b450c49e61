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

#include "catch2/catch_test_macros.hpp"
#include "nlohmann/json.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/coordinator/request.hpp"

TEST_CASE("Registry error codes", "[registry_response]") {
    SECTION("unknown content depends on the operation") {
        auto blob = ToRegistryErrorCode(ErrorCode::NotFound, Operation::GetBlob);
        CHECK(blob.status == 404);
        CHECK(blob.code == "BLOB_UNKNOWN");
        auto manifest = ToRegistryErrorCode(ErrorCode::NotFound,
                                            Operation::HeadManifest);
        CHECK(manifest.code == "MANIFEST_UNKNOWN");
        auto tags =
            ToRegistryErrorCode(ErrorCode::NotFound, Operation::ListTags);
        CHECK(tags.code == "NAME_UNKNOWN");
    }

    SECTION("invalid names") {
        CHECK(ToRegistryErrorCode(ErrorCode::InvalidName, Operation::GetBlob)
                  .code == "NAME_INVALID");
        CHECK(ToRegistryErrorCode(
                  ErrorCode::InvalidName, Operation::PutManifest, true)
                  .code == "TAG_INVALID");
    }

    SECTION("statuses") {
        CHECK(ToRegistryErrorCode(ErrorCode::Busy, Operation::GetBlob).status ==
              429);
        CHECK(ToRegistryErrorCode(ErrorCode::UpstreamUnavailable,
                                  Operation::GetBlob)
                  .status == 503);
        CHECK(ToRegistryErrorCode(ErrorCode::DanglingReference,
                                  Operation::PutManifest)
                  .code == "MANIFEST_BLOB_UNKNOWN");
        CHECK(ToRegistryErrorCode(ErrorCode::CapacityExceeded,
                                  Operation::PutBlob)
                  .status == 507);
        CHECK(ToRegistryErrorCode(ErrorCode::UploadUnknown,
                                  Operation::PatchUpload)
                  .code == "BLOB_UPLOAD_UNKNOWN");
        CHECK(ToRegistryErrorCode(ErrorCode::Unsupported, Operation::PutBlob)
                  .status == 405);
        CHECK(ToRegistryErrorCode(ErrorCode::CorruptionDetected,
                                  Operation::GetBlob)
                  .status == 500);
    }
}

TEST_CASE("Error responses", "[registry_response]") {
    SECTION("carry the registry error document") {
        auto response = RegistryResponse::FromError(
            Error{ErrorCode::InvalidDigest, "bad digest"}, Operation::PutBlob);
        CHECK(response.status == 400);
        CHECK(not response.IsSuccess());
        CHECK(not response.IsRetryable());
        CHECK(response.Header("Content-Type") == "application/json");
        CHECK(not response.Header("Retry-After"));

        auto document = nlohmann::json::parse(response.body);
        REQUIRE(document["errors"].size() == 1);
        CHECK(document["errors"][0]["code"].get<std::string>() ==
              "DIGEST_INVALID");
        CHECK(document["errors"][0]["message"].get<std::string>() ==
              "bad digest");
        CHECK(response.Header("Content-Length") ==
              std::to_string(response.body.size()));
    }

    SECTION("retryable errors advise when to retry") {
        auto busy = RegistryResponse::FromError(
            Error{ErrorCode::Busy, "lock wait timed out"}, Operation::GetBlob);
        CHECK(busy.IsRetryable());
        CHECK(busy.Header("Retry-After") ==
              std::to_string(kBusyRetryAfterSeconds));

        auto unavailable = RegistryResponse::FromError(
            Error{ErrorCode::UpstreamUnavailable, "offline"},
            Operation::GetManifest);
        CHECK(unavailable.IsRetryable());
        CHECK(unavailable.Header("Retry-After") ==
              std::to_string(kUnavailableRetryAfterSeconds));
    }
}

TEST_CASE("Operation classification", "[registry_response]") {
    CHECK(IsWrite(Operation::PutBlob));
    CHECK(IsWrite(Operation::PatchUpload));
    CHECK(IsWrite(Operation::DeleteTag));
    CHECK(not IsWrite(Operation::HeadBlob));
    CHECK(not IsWrite(Operation::ListTags));
    CHECK(IsManifestOperation(Operation::PutManifest));
    CHECK(not IsManifestOperation(Operation::CompleteUpload));
    CHECK(ToString(Facet::Mirror) == "mirror");
}
