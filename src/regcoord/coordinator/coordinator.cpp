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

#include "src/regcoord/coordinator/coordinator.hpp"

#include <exception>
#include <utility>

#include "fmt/core.h"
#include "nlohmann/json.hpp"
#include "src/regcoord/common/reference.hpp"
#include "src/regcoord/logging/log_level.hpp"

namespace {

inline constexpr auto kBlobContentType = "application/octet-stream";

// NOLINTBEGIN(readability-magic-numbers)
[[nodiscard]] auto BlobResponse(std::string const& repository,
                                Digest const& digest,
                                int status) -> RegistryResponse {
    RegistryResponse response{.status = status};
    response.headers["Docker-Content-Digest"] = digest.ToString();
    response.headers["Location"] =
        fmt::format("/v2/{}/blobs/{}", repository, digest.ToString());
    response.headers["Content-Length"] = "0";
    return response;
}

[[nodiscard]] auto UploadResponse(UploadStatus const& upload)
    -> RegistryResponse {
    RegistryResponse response{.status = 202};
    response.headers["Location"] = fmt::format(
        "/v2/{}/blobs/uploads/{}", upload.repository, upload.uuid);
    response.headers["Docker-Upload-UUID"] = upload.uuid;
    response.headers["Range"] =
        fmt::format("0-{}", upload.offset > 0 ? upload.offset - 1 : 0);
    response.headers["Content-Length"] = "0";
    return response;
}
// NOLINTEND(readability-magic-numbers)

}  // namespace

Coordinator::Coordinator(CoordinatorOptions options,
                         std::unique_ptr<AuditLog> audit,
                         std::unique_ptr<BlobStore> store)
    : options_{std::move(options)},
      audit_{std::move(audit)},
      store_{std::move(store)},
      locks_{options_.locking},
      local_{store_.get(), &locks_},
      collector_{store_.get(), &locks_} {
    if (options_.upstream) {
        mirror_ = std::make_unique<MirrorFacet>(store_.get(),
                                                &locks_,
                                                audit_.get(),
                                                options_.upstream,
                                                options_.retry,
                                                options_.tag_ttl);
    }
    scheduler_ =
        std::make_unique<GcScheduler>(&collector_, options_.gc_interval);
}

Coordinator::~Coordinator() noexcept {
    Shutdown();
}

auto Coordinator::Create(CoordinatorOptions options) noexcept
    -> expected<std::unique_ptr<Coordinator>, Error> {
    try {
        auto audit = std::make_unique<AuditLog>(options.audit_file);
        auto store = BlobStore::Open(options.store, audit.get());
        if (not store) {
            return unexpected{store.error()};
        }
        auto coordinator = std::unique_ptr<Coordinator>(new Coordinator(
            std::move(options), std::move(audit), *std::move(store)));
        coordinator->logger_.Emit(
            LogLevel::Info,
            "coordinating store {} (mirror facet {})",
            coordinator->store_->Config().root.string(),
            coordinator->mirror_ ? "enabled" : "disabled");
        return coordinator;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("creating coordinator failed: {}", e.what()));
    }
}

auto Coordinator::Handle(RegistryRequest const& request) noexcept
    -> RegistryResponse {
    try {
        logger_.Emit(LogLevel::Debug,
                     "{} {} {}",
                     ToString(request.operation),
                     request.repository,
                     request.reference.empty() ? request.upload_uuid
                                               : request.reference);
        auto facet = Route(request);
        if (not facet) {
            return ErrorResponse(facet.error(), request);
        }
        if (*facet) {
            return Serve(**facet, request);
        }
        auto response = Serve(Facet::Local, request);
        if (mirror_ and not IsWrite(request.operation) and
            response.error and response.error->code == ErrorCode::NotFound) {
            logger_.Emit(LogLevel::Debug,
                         "not found locally, trying the mirror");
            return Serve(Facet::Mirror, request);
        }
        return response;
    } catch (std::exception const& e) {
        return ErrorResponse(
            Error{ErrorCode::IoFailure,
                  fmt::format("serving request failed: {}", e.what())},
            request);
    }
}

auto Coordinator::CollectGarbage(bool dry_run) noexcept
    -> expected<GcReport, Error> {
    return collector_.Run(dry_run);
}

void Coordinator::TriggerGc() noexcept {
    scheduler_->Trigger();
}

auto Coordinator::Verify() noexcept -> expected<VerifyReport, Error> {
    try {
        auto lease = locks_.AcquireLease();
        if (not lease) {
            return unexpected{lease.error()};
        }
        auto blobs = store_->ListBlobs(*lease);
        if (not blobs) {
            return unexpected{blobs.error()};
        }
        VerifyReport report{};
        for (auto const& digest : *blobs) {
            ++report.checked;
            auto content = store_->Get(digest, *lease);
            if (content or content.error().code == ErrorCode::NotFound) {
                continue;
            }
            if (content.error().code != ErrorCode::CorruptionDetected) {
                logger_.Emit(LogLevel::Warning,
                             "could not verify {}: {}",
                             digest.ToString(),
                             content.error().message);
                ++report.failed;
                continue;
            }
            auto moved = store_->Quarantine(digest, *lease);
            if (not moved) {
                logger_.Emit(LogLevel::Error,
                             "could not quarantine {}: {}",
                             digest.ToString(),
                             moved.error().message);
                ++report.failed;
                continue;
            }
            report.corrupted.push_back(digest);
        }
        logger_.Emit(LogLevel::Info,
                     "verified {} blobs, {} corrupted",
                     report.checked,
                     report.corrupted.size());
        return report;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("verification failed: {}", e.what()));
    }
}

void Coordinator::Shutdown() noexcept {
    if (scheduler_) {
        scheduler_->Stop();
    }
}

auto Coordinator::Route(RegistryRequest const& request) const
    -> expected<std::optional<Facet>, Error> {
    if (request.facet) {
        return std::optional<Facet>{*request.facet};
    }
    if (request.endpoint) {
        if (options_.mirror_endpoint and
            *request.endpoint == *options_.mirror_endpoint) {
            return std::optional<Facet>{Facet::Mirror};
        }
        if (options_.local_endpoint and
            *request.endpoint == *options_.local_endpoint) {
            return std::optional<Facet>{Facet::Local};
        }
        return MakeError(
            ErrorCode::Unsupported,
            fmt::format("no facet listens on {}", *request.endpoint));
    }
    return std::optional<Facet>{};
}

auto Coordinator::Serve(Facet facet, RegistryRequest const& request)
    -> RegistryResponse {
    return facet == Facet::Mirror ? ServeMirror(request) : ServeLocal(request);
}

auto Coordinator::ServeMirror(RegistryRequest const& request)
    -> RegistryResponse {
    if (IsWrite(request.operation)) {
        return ErrorResponse(
            Error{ErrorCode::Unsupported,
                  fmt::format("{} is not supported by the read-only mirror",
                              ToString(request.operation))},
            request);
    }
    if (not mirror_) {
        return ErrorResponse(Error{ErrorCode::Unsupported,
                                   "no upstream registry is configured"},
                             request);
    }
    switch (request.operation) {
        case Operation::GetBlob:
        case Operation::HeadBlob: {
            auto digest = Digest::Parse(request.reference);
            if (not digest) {
                return ErrorResponse(digest.error(), request);
            }
            if (request.operation == Operation::HeadBlob) {
                auto size = mirror_->HeadBlob(request.repository, *digest);
                if (not size) {
                    return ErrorResponse(size.error(), request);
                }
                RegistryResponse response{};
                response.headers["Docker-Content-Digest"] = digest->ToString();
                response.headers["Content-Type"] = kBlobContentType;
                response.headers["Content-Length"] = std::to_string(*size);
                return response;
            }
            auto blob = mirror_->GetBlob(request.repository, *digest);
            if (not blob) {
                return ErrorResponse(blob.error(), request);
            }
            RegistryResponse response{};
            response.headers["Docker-Content-Digest"] = digest->ToString();
            response.headers["Content-Type"] = kBlobContentType;
            response.headers["Content-Length"] = std::to_string(blob->size());
            response.body = *std::move(blob);
            return response;
        }
        case Operation::GetManifest:
        case Operation::HeadManifest: {
            auto manifest =
                mirror_->GetManifest(request.repository, request.reference);
            if (not manifest) {
                return ErrorResponse(manifest.error(), request);
            }
            RegistryResponse response{};
            response.headers["Docker-Content-Digest"] =
                manifest->digest.ToString();
            response.headers["Content-Type"] = manifest->media_type;
            response.headers["Content-Length"] =
                std::to_string(manifest->content.size());
            if (request.operation == Operation::GetManifest) {
                response.body = manifest->content;
            }
            return response;
        }
        case Operation::ListTags: {
            // the mirror knows only the tags it cached
            return ServeLocal(request);
        }
        default:
            break;
    }
    return ErrorResponse(
        Error{ErrorCode::Unsupported,
              fmt::format("{} is not supported by the mirror",
                          ToString(request.operation))},
        request);
}

auto Coordinator::ServeLocal(RegistryRequest const& request)
    -> RegistryResponse {
    // NOLINTBEGIN(readability-magic-numbers)
    switch (request.operation) {
        case Operation::GetBlob: {
            auto digest = Digest::Parse(request.reference);
            if (not digest) {
                return ErrorResponse(digest.error(), request);
            }
            auto blob = local_.GetBlob(request.repository, *digest);
            if (not blob) {
                return ErrorResponse(blob.error(), request);
            }
            RegistryResponse response{};
            response.headers["Docker-Content-Digest"] = digest->ToString();
            response.headers["Content-Type"] = kBlobContentType;
            response.headers["Content-Length"] = std::to_string(blob->size());
            response.body = *std::move(blob);
            return response;
        }
        case Operation::HeadBlob: {
            auto digest = Digest::Parse(request.reference);
            if (not digest) {
                return ErrorResponse(digest.error(), request);
            }
            auto size = local_.HeadBlob(request.repository, *digest);
            if (not size) {
                return ErrorResponse(size.error(), request);
            }
            RegistryResponse response{};
            response.headers["Docker-Content-Digest"] = digest->ToString();
            response.headers["Content-Type"] = kBlobContentType;
            response.headers["Content-Length"] = std::to_string(*size);
            return response;
        }
        case Operation::GetManifest:
        case Operation::HeadManifest: {
            auto manifest =
                local_.GetManifest(request.repository, request.reference);
            if (not manifest) {
                return ErrorResponse(manifest.error(), request);
            }
            RegistryResponse response{};
            response.headers["Docker-Content-Digest"] =
                manifest->digest.ToString();
            response.headers["Content-Type"] = manifest->media_type;
            response.headers["Content-Length"] =
                std::to_string(manifest->content.size());
            if (request.operation == Operation::GetManifest) {
                response.body = manifest->content;
            }
            return response;
        }
        case Operation::PutBlob: {
            auto digest = Digest::Parse(request.reference);
            if (not digest) {
                return ErrorResponse(digest.error(), request);
            }
            auto ack =
                local_.PutBlob(request.repository, *digest, request.body);
            if (not ack) {
                return ErrorResponse(ack.error(), request);
            }
            return BlobResponse(request.repository, *digest, 201);
        }
        case Operation::StartUpload: {
            auto upload = local_.StartUpload(request.repository);
            if (not upload) {
                return ErrorResponse(upload.error(), request);
            }
            return UploadResponse(*upload);
        }
        case Operation::PatchUpload:
        case Operation::CompleteUpload:
        case Operation::CancelUpload: {
            auto upload = local_.UploadStatusOf(request.upload_uuid);
            if (upload and upload->repository != request.repository) {
                upload = MakeError(
                    ErrorCode::UploadUnknown,
                    fmt::format("upload {} does not belong to {}",
                                request.upload_uuid,
                                request.repository));
            }
            if (not upload) {
                return ErrorResponse(upload.error(), request);
            }
            if (request.operation == Operation::PatchUpload) {
                auto patched =
                    local_.AppendChunk(request.upload_uuid, request.body);
                if (not patched) {
                    return ErrorResponse(patched.error(), request);
                }
                return UploadResponse(*patched);
            }
            if (request.operation == Operation::CancelUpload) {
                auto cancelled = local_.CancelUpload(request.upload_uuid);
                if (not cancelled) {
                    return ErrorResponse(cancelled.error(), request);
                }
                return RegistryResponse{.status = 204};
            }
            auto digest = Digest::Parse(request.reference);
            if (not digest) {
                // the session stays open for a corrected request
                return ErrorResponse(digest.error(), request);
            }
            auto ack = local_.CommitUpload(
                request.upload_uuid,
                *digest,
                request.body.empty() ? std::nullopt
                                     : std::optional<std::string>{
                                           request.body});
            if (not ack) {
                return ErrorResponse(ack.error(), request);
            }
            return BlobResponse(request.repository, *digest, 201);
        }
        case Operation::PutManifest: {
            auto digest = local_.PutManifest(request.repository,
                                             request.reference,
                                             request.body,
                                             request.content_type);
            if (not digest) {
                return ErrorResponse(digest.error(), request);
            }
            RegistryResponse response{.status = 201};
            response.headers["Docker-Content-Digest"] = digest->ToString();
            response.headers["Location"] = fmt::format(
                "/v2/{}/manifests/{}", request.repository, digest->ToString());
            response.headers["Content-Length"] = "0";
            return response;
        }
        case Operation::ListTags: {
            auto tags = local_.ListTags(request.repository);
            if (not tags) {
                return ErrorResponse(tags.error(), request);
            }
            RegistryResponse response{};
            response.body =
                nlohmann::json{{"name", request.repository}, {"tags", *tags}}
                    .dump();
            response.headers["Content-Type"] = "application/json";
            response.headers["Content-Length"] =
                std::to_string(response.body.size());
            return response;
        }
        case Operation::DeleteTag: {
            auto removed =
                local_.DeleteTag(request.repository, request.reference);
            if (not removed) {
                return ErrorResponse(removed.error(), request);
            }
            return RegistryResponse{.status = 202};
        }
    }
    // NOLINTEND(readability-magic-numbers)
    return ErrorResponse(Error{ErrorCode::Unsupported, "unknown operation"},
                         request);
}

auto Coordinator::ErrorResponse(Error error, RegistryRequest const& request)
    -> RegistryResponse {
    auto const tag_invalid =
        error.code == ErrorCode::InvalidName and
        ValidateRepositoryName(request.repository).has_value();
    Logger::Log(error.IsRetryable() ? LogLevel::Debug : LogLevel::Info,
                "{} {} failed: {}",
                ToString(request.operation),
                request.repository,
                error.ToString());
    return RegistryResponse::FromError(
        std::move(error), request.operation, tag_invalid);
}
