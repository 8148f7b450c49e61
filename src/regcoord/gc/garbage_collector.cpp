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

#include "src/regcoord/gc/garbage_collector.hpp"

#include <deque>
#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/storage/manifest.hpp"

auto GarbageCollector::Run(bool dry_run) noexcept
    -> expected<GcReport, Error> {
    try {
        logger_.Emit(LogLevel::Info,
                     "starting {}garbage collection",
                     dry_run ? "dry-run " : "");
        auto lease = locks_->AcquireLease();
        if (not lease) {
            return unexpected{lease.error()};
        }

        GcReport report{.dry_run = dry_run};
        auto marked = Mark(*lease, &report);
        if (not marked) {
            logger_.Emit(LogLevel::Error,
                         "garbage collection aborted: {}",
                         marked.error().message);
            return unexpected{marked.error()};
        }

        auto stored = store_->ListBlobs(*lease);
        if (not stored) {
            return unexpected{stored.error()};
        }
        for (auto const& digest : *stored) {
            if (marked->contains(digest)) {
                ++report.marked;
                continue;
            }
            if (dry_run) {
                auto size = store_->Size(digest, *lease);
                report.bytes_freed += size.value_or(0);
                ++report.removed;
                report.unreachable.push_back(digest);
                continue;
            }
            auto freed = store_->Delete(digest, *lease);
            if (not freed) {
                if (freed.error().code != ErrorCode::NotFound) {
                    logger_.Emit(LogLevel::Warning,
                                 "could not delete {}: {}",
                                 digest.ToString(),
                                 freed.error().message);
                    ++report.failed;
                }
                continue;
            }
            logger_.Emit(
                LogLevel::Debug, "deleted unreachable {}", digest.ToString());
            report.bytes_freed += *freed;
            ++report.removed;
            report.unreachable.push_back(digest);
        }

        if (not dry_run) {
            // no writer holds a lock, so every temporary file is stale
            auto removed = store_->RemoveTemporaries(*lease);
            if (removed) {
                report.temporaries = *removed;
            }
            else {
                logger_.Emit(LogLevel::Warning,
                             "removing temporary files failed: {}",
                             removed.error().message);
            }
        }

        logger_.Emit(LogLevel::Info,
                     "garbage collection {}: {} repositories, {} blobs "
                     "marked, {} {}, {} bytes",
                     dry_run ? "dry run done" : "done",
                     report.repositories,
                     report.marked,
                     report.removed,
                     dry_run ? "unreachable" : "removed",
                     report.bytes_freed);
        return report;
    } catch (std::exception const& e) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("garbage collection failed: {}", e.what()));
    }
}

auto GarbageCollector::Mark(LockToken const& lease, GcReport* report) const
    -> expected<std::set<Digest>, Error> {
    auto repositories = store_->ListRepositories(lease);
    if (not repositories) {
        return unexpected{repositories.error()};
    }

    std::set<Digest> marked{};
    std::deque<Digest> manifests{};
    for (auto const& repository : *repositories) {
        auto index = store_->ReadTagIndex(repository, lease);
        if (not index) {
            return unexpected{index.error()};
        }
        ++report->repositories;
        for (auto const& root : index->Roots()) {
            manifests.push_back(root);
        }
    }

    while (not manifests.empty()) {
        auto digest = std::move(manifests.front());
        manifests.pop_front();
        if (not marked.insert(digest).second) {
            continue;
        }
        auto content = store_->Get(digest, lease);
        if (not content) {
            // a root must be a stored manifest; anything else is a broken
            // store and sweeping it could lose data
            return MakeError(content.error().code,
                             fmt::format("reading manifest {} failed: {}",
                                         digest.ToString(),
                                         content.error().message));
        }
        auto manifest = Manifest::Parse(*content);
        if (not manifest) {
            return MakeError(manifest.error().code,
                             fmt::format("parsing manifest {} failed: {}",
                                         digest.ToString(),
                                         manifest.error().message));
        }
        if (manifest->GetKind() == Manifest::Kind::Index) {
            for (auto const& child : manifest->Manifests()) {
                manifests.push_back(child.digest);
            }
            continue;
        }
        for (auto const& referenced : manifest->AllDigests()) {
            marked.insert(referenced);
        }
    }
    return marked;
}
