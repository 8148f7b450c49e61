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

#include "src/regcoord/facets/mirror_facet.hpp"

#include <exception>
#include <utility>
#include <variant>
#include <vector>

#include "fmt/core.h"
#include "src/regcoord/common/reference.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "src/regcoord/upstream/retry.hpp"

namespace {

[[nodiscard]] auto UnixNow() noexcept -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// \brief Media type of a Content-Type header value, if it is a manifest
/// type this store understands.
[[nodiscard]] auto NormalizeContentType(
    std::optional<std::string> const& content_type)
    -> std::optional<std::string> {
    if (not content_type) {
        return std::nullopt;
    }
    auto type = content_type->substr(0, content_type->find(';'));
    while (not type.empty() and type.back() == ' ') {
        type.pop_back();
    }
    if (Manifest::IsSupportedMediaType(type)) {
        return type;
    }
    return std::nullopt;
}

}  // namespace

MirrorFacet::MirrorFacet(gsl::not_null<BlobStore*> const& store,
                         gsl::not_null<LockManager*> const& locks,
                         gsl::not_null<AuditLog const*> const& audit,
                         IUpstreamRegistry::Ptr upstream,
                         RetryConfig retry,
                         std::chrono::seconds tag_ttl) noexcept
    : store_{store},
      locks_{locks},
      audit_{audit},
      upstream_{std::move(upstream)},
      retry_{std::move(retry)},
      tag_ttl_{tag_ttl} {
    Expects(upstream_ != nullptr);
}

auto MirrorFacet::GetBlob(std::string const& repository,
                          Digest const& digest) noexcept
    -> expected<std::string, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    return Pull(digest, [this, &repository, &digest]() {
        return upstream_->FetchBlob(repository, digest);
    });
}

auto MirrorFacet::HeadBlob(std::string const& repository,
                           Digest const& digest) noexcept
    -> expected<std::uintmax_t, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto pulled = Prefetch(digest, [this, &repository, &digest]() {
        return upstream_->FetchBlob(repository, digest);
    });
    if (not pulled) {
        return unexpected{pulled.error()};
    }
    auto token = locks_->Acquire(LockKey::ForDigest(digest), LockMode::Shared);
    if (not token) {
        return unexpected{token.error()};
    }
    return store_->Size(digest, *token);
}

auto MirrorFacet::GetManifest(std::string const& repository,
                              std::string const& reference) noexcept
    -> expected<ManifestContent, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto parsed = ParseManifestReference(reference);
    if (not parsed) {
        return unexpected{parsed.error()};
    }
    if (auto const* digest = std::get_if<Digest>(&*parsed)) {
        return GetManifestByDigest(repository, *digest);
    }
    return GetManifestByTag(repository, std::get<std::string>(*parsed));
}

auto MirrorFacet::ReadCached(Digest const& digest) noexcept
    -> expected<std::optional<std::string>, Error> {
    {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Shared);
        if (not token) {
            return unexpected{token.error()};
        }
        auto cached = store_->Get(digest, *token);
        if (cached) {
            return std::optional<std::string>{*std::move(cached)};
        }
        if (cached.error().code == ErrorCode::NotFound) {
            return std::optional<std::string>{};
        }
        if (cached.error().code != ErrorCode::CorruptionDetected) {
            return unexpected{cached.error()};
        }
    }
    // the shared token is gone, quarantining needs the exclusive one
    QuarantineCorrupted(digest);
    return MakeError(ErrorCode::CorruptionDetected,
                     fmt::format("cached blob {} is corrupted and was "
                                 "quarantined",
                                 digest.ToString()));
}

auto MirrorFacet::Pull(Digest const& digest, Fetch const& fetch) noexcept
    -> expected<std::string, Error> {
    auto cached = ReadCached(digest);
    if (not cached) {
        return unexpected{cached.error()};
    }
    if (*cached) {
        logger_.Emit(LogLevel::Trace, "cache hit for {}", digest.ToString());
        return **std::move(cached);
    }
    return PullCoalesced(digest, fetch);
}

auto MirrorFacet::PullCoalesced(Digest const& digest,
                                Fetch const& fetch) noexcept
    -> expected<std::string, Error> {
    try {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Exclusive);
        if (not token) {
            return unexpected{token.error()};
        }

        // another request may have fetched it while we were waiting
        auto stored = store_->Get(digest, *token);
        if (stored) {
            logger_.Emit(LogLevel::Debug,
                         "{} was fetched concurrently",
                         digest.ToString());
            return *std::move(stored);
        }
        if (stored.error().code == ErrorCode::CorruptionDetected) {
            auto moved = store_->Quarantine(digest, *token);
            if (not moved) {
                logger_.Emit(LogLevel::Warning,
                             "quarantining {} failed: {}",
                             digest.ToString(),
                             moved.error().message);
            }
            return unexpected{stored.error()};
        }
        if (stored.error().code != ErrorCode::NotFound) {
            return unexpected{stored.error()};
        }

        auto fetched = FetchWithRetry(fetch, digest.ToString());
        if (not fetched) {
            return unexpected{fetched.error()};
        }
        if (not digest.Matches(fetched->content)) {
            auto actual = Digest::Compute(fetched->content,
                                          digest.Algorithm());
            audit_->Record(
                "upstream-corruption",
                digest.ToString(),
                {{"actual", actual ? actual->ToString() : std::string{}},
                 {"size", fetched->content.size()}});
            return MakeError(ErrorCode::CorruptionDetected,
                             fmt::format("upstream content for {} does not "
                                         "match its digest",
                                         digest.ToString()));
        }
        auto ack = store_->Put(digest, fetched->content, *token);
        if (not ack) {
            return unexpected{ack.error()};
        }
        logger_.Emit(LogLevel::Info,
                     "cached {} ({} bytes)",
                     digest.ToString(),
                     fetched->content.size());
        return std::move(fetched->content);
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("pulling {} failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto MirrorFacet::Prefetch(Digest const& digest, Fetch const& fetch) noexcept
    -> expected<std::monostate, Error> {
    {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Shared);
        if (not token) {
            return unexpected{token.error()};
        }
        auto present = store_->Has(digest, *token);
        if (not present) {
            return unexpected{present.error()};
        }
        if (*present) {
            return std::monostate{};
        }
    }
    auto pulled = PullCoalesced(digest, fetch);
    if (not pulled) {
        return unexpected{pulled.error()};
    }
    return std::monostate{};
}

auto MirrorFacet::FetchWithRetry(Fetch const& fetch,
                                 std::string const& what) noexcept
    -> expected<UpstreamContent, Error> {
    return WithRetry<UpstreamContent>(fetch, retry_, logger_, what);
}

auto MirrorFacet::Ingest(std::string const& repository,
                         std::optional<std::string> const& tag,
                         Digest const& digest,
                         UpstreamContent const& fetched) noexcept
    -> expected<ManifestContent, Error> {
    try {
        auto content_type = NormalizeContentType(fetched.content_type);
        auto manifest = Manifest::Parse(fetched.content, content_type);
        if (not manifest) {
            return unexpected{manifest.error()};
        }
        bool const is_index = manifest->GetKind() == Manifest::Kind::Index;
        for (auto const& required : manifest->RequiredDigests()) {
            auto cached = Prefetch(
                required, [this, is_index, &repository, &required]() {
                    return is_index
                               ? upstream_->FetchManifest(repository,
                                                          required.ToString())
                               : upstream_->FetchBlob(repository, required);
                });
            if (not cached) {
                return unexpected{cached.error()};
            }
        }

        auto token = locks_->AcquireAll(BlobStore::ManifestLocks(
            repository, digest, manifest->RequiredDigests()));
        if (not token) {
            return unexpected{token.error()};
        }
        auto ack = store_->PutManifest(repository,
                                       tag,
                                       digest,
                                       fetched.content,
                                       content_type,
                                       *token);
        if (not ack) {
            return unexpected{ack.error()};
        }
        logger_.Emit(LogLevel::Info,
                     "mirrored manifest {}:{} ({})",
                     repository,
                     tag.value_or(digest.ToString()),
                     digest.ToString());
        return ManifestContent{.digest = digest,
                               .content = fetched.content,
                               .media_type = manifest->MediaType()};
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("ingesting manifest {} failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto MirrorFacet::GetManifestByTag(std::string const& repository,
                                   std::string const& tag) noexcept
    -> expected<ManifestContent, Error> {
    std::optional<TagEntry> cached{};
    {
        auto token = locks_->Acquire(LockKey::ForRepository(repository),
                                     LockMode::Shared);
        if (not token) {
            return unexpected{token.error()};
        }
        auto entry = store_->ResolveTag(repository, tag, *token);
        if (entry) {
            cached = *entry;
        }
        else if (entry.error().code != ErrorCode::NotFound) {
            return unexpected{entry.error()};
        }
    }

    if (cached and UnixNow() - cached->updated < tag_ttl_.count()) {
        auto manifest = ReadManifest(cached->digest);
        if (manifest or manifest.error().code != ErrorCode::NotFound) {
            return manifest;
        }
    }

    auto fetched = FetchWithRetry(
        [this, &repository, &tag]() {
            return upstream_->FetchManifest(repository, tag);
        },
        fmt::format("{}:{}", repository, tag));
    if (not fetched) {
        if (cached and
            fetched.error().code == ErrorCode::UpstreamUnavailable) {
            logger_.Emit(LogLevel::Warning,
                         "upstream unavailable, serving stale {}:{}",
                         repository,
                         tag);
            auto stale = ReadManifest(cached->digest);
            if (stale) {
                return stale;
            }
        }
        return unexpected{fetched.error()};
    }
    auto digest = Digest::Compute(fetched->content);
    if (not digest) {
        return MakeError(ErrorCode::IoFailure,
                         "could not hash fetched manifest");
    }
    return Ingest(repository, tag, *digest, *fetched);
}

auto MirrorFacet::GetManifestByDigest(std::string const& repository,
                                      Digest const& digest) noexcept
    -> expected<ManifestContent, Error> {
    auto cached = ReadManifest(digest);
    if (cached or cached.error().code != ErrorCode::NotFound) {
        return cached;
    }
    std::optional<std::string> content_type{};
    auto content = PullCoalesced(digest, [&]() {
        auto fetched =
            upstream_->FetchManifest(repository, digest.ToString());
        if (fetched) {
            content_type = fetched->content_type;
        }
        return fetched;
    });
    if (not content) {
        return unexpected{content.error()};
    }
    return Ingest(repository,
                  std::nullopt,
                  digest,
                  UpstreamContent{.content = *std::move(content),
                                  .content_type = content_type});
}

auto MirrorFacet::ReadManifest(Digest const& digest) noexcept
    -> expected<ManifestContent, Error> {
    auto cached = ReadCached(digest);
    if (not cached) {
        return unexpected{cached.error()};
    }
    if (not *cached) {
        return MakeError(
            ErrorCode::NotFound,
            fmt::format("manifest {} not cached", digest.ToString()));
    }
    auto manifest = Manifest::Parse(**cached);
    if (not manifest) {
        return unexpected{manifest.error()};
    }
    return ManifestContent{.digest = digest,
                           .content = **std::move(cached),
                           .media_type = manifest->MediaType()};
}

void MirrorFacet::QuarantineCorrupted(Digest const& digest) noexcept {
    auto token =
        locks_->Acquire(LockKey::ForDigest(digest), LockMode::Exclusive);
    if (not token) {
        logger_.Emit(LogLevel::Warning,
                     "could not lock {} for quarantine: {}",
                     digest.ToString(),
                     token.error().message);
        return;
    }
    auto moved = store_->Quarantine(digest, *token);
    if (not moved and moved.error().code != ErrorCode::NotFound) {
        logger_.Emit(LogLevel::Warning,
                     "quarantining {} failed: {}",
                     digest.ToString(),
                     moved.error().message);
    }
}
