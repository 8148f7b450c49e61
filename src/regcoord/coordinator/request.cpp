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

#include "src/regcoord/coordinator/request.hpp"

auto ToString(Operation operation) noexcept -> std::string {
    switch (operation) {
        case Operation::GetManifest:
            return "GetManifest";
        case Operation::HeadManifest:
            return "HeadManifest";
        case Operation::GetBlob:
            return "GetBlob";
        case Operation::HeadBlob:
            return "HeadBlob";
        case Operation::PutBlob:
            return "PutBlob";
        case Operation::StartUpload:
            return "StartUpload";
        case Operation::PatchUpload:
            return "PatchUpload";
        case Operation::CompleteUpload:
            return "CompleteUpload";
        case Operation::CancelUpload:
            return "CancelUpload";
        case Operation::PutManifest:
            return "PutManifest";
        case Operation::ListTags:
            return "ListTags";
        case Operation::DeleteTag:
            return "DeleteTag";
    }
    return "Unknown";
}

auto ToString(Facet facet) noexcept -> std::string {
    return facet == Facet::Mirror ? "mirror" : "local";
}

auto IsWrite(Operation operation) noexcept -> bool {
    switch (operation) {
        case Operation::PutBlob:
        case Operation::StartUpload:
        case Operation::PatchUpload:
        case Operation::CompleteUpload:
        case Operation::CancelUpload:
        case Operation::PutManifest:
        case Operation::DeleteTag:
            return true;
        default:
            return false;
    }
}

auto IsManifestOperation(Operation operation) noexcept -> bool {
    return operation == Operation::GetManifest or
           operation == Operation::HeadManifest or
           operation == Operation::PutManifest or
           operation == Operation::DeleteTag;
}
