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

#ifndef INCLUDED_SRC_REGCOORD_COORDINATOR_REQUEST_HPP
#define INCLUDED_SRC_REGCOORD_COORDINATOR_REQUEST_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class Operation : std::uint8_t {
    GetManifest,
    HeadManifest,
    GetBlob,
    HeadBlob,
    PutBlob,
    StartUpload,
    PatchUpload,
    CompleteUpload,
    CancelUpload,
    PutManifest,
    ListTags,
    DeleteTag
};

enum class Facet : std::uint8_t { Mirror, Local };

[[nodiscard]] auto ToString(Operation operation) noexcept -> std::string;

[[nodiscard]] auto ToString(Facet facet) noexcept -> std::string;

/// \brief Whether an operation modifies the store.
[[nodiscard]] auto IsWrite(Operation operation) noexcept -> bool;

/// \brief Whether an operation addresses manifests rather than blobs.
[[nodiscard]] auto IsManifestOperation(Operation operation) noexcept -> bool;

/// \brief Registry request as handed over by a front end.
struct RegistryRequest {
    Operation operation{Operation::GetBlob};

    // Facet to serve the request. If unset, the facet is chosen by the
    // endpoint the request arrived on, or by the operation.
    std::optional<Facet> facet;
    std::optional<std::string> endpoint;

    std::string repository;

    // Tag or digest of manifest operations, digest of blob operations and of
    // CompleteUpload; unused otherwise.
    std::string reference;

    // Session of PatchUpload, CompleteUpload and CancelUpload.
    std::string upload_uuid;

    std::string body;
    std::optional<std::string> content_type;
};

#endif  // INCLUDED_SRC_REGCOORD_COORDINATOR_REQUEST_HPP
