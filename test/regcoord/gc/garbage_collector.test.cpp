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

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "catch2/catch_test_macros.hpp"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/facets/local_facet.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/gc/gc_scheduler.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "test/utils/hermeticity/test_store_config.hpp"
#include "test/utils/registry/image_creator.hpp"

namespace {

class GcFixture {
  public:
    GcFixture() : store_{Open(test_config_.Get(), audit_)} {}

    [[nodiscard]] auto Collector() noexcept -> GarbageCollector& {
        return collector_;
    }

    [[nodiscard]] auto Local() noexcept -> LocalFacet& { return local_; }

    [[nodiscard]] auto Locks() noexcept -> LockManager& { return locks_; }

    [[nodiscard]] auto Store() noexcept -> BlobStore& { return *store_; }

    [[nodiscard]] auto IsStored(Digest const& digest) const -> bool {
        return FileSystemManager::IsFile(test_config_.Get().BlobPath(digest));
    }

    [[nodiscard]] auto Config() const noexcept -> StoreConfig const& {
        return test_config_.Get();
    }

    void PushImage(std::string const& repository,
                   TestImage const& image,
                   std::string const& reference) {
        PushBlobs(repository, image);
        REQUIRE(local_.PutManifest(
            repository, reference, image.manifest.content, std::nullopt));
    }

    void PushBlobs(std::string const& repository, TestImage const& image) {
        REQUIRE(local_.PutBlob(
            repository, image.config.digest, image.config.content));
        for (auto const& layer : image.layers) {
            REQUIRE(local_.PutBlob(repository, layer.digest, layer.content));
        }
    }

  private:
    TestStoreConfig test_config_{TestStoreConfig::Create()};
    AuditLog audit_{std::nullopt};
    LockManager locks_{LockManager::Options{
        .wait_timeout = std::chrono::seconds{5},
        .lease_grace = std::chrono::milliseconds{100},
        .lease_timeout = std::chrono::seconds{5}}};
    std::unique_ptr<BlobStore> store_;
    LocalFacet local_{store_.get(), &locks_};
    GarbageCollector collector_{store_.get(), &locks_};

    [[nodiscard]] static auto Open(StoreConfig const& config,
                                   AuditLog const& audit)
        -> std::unique_ptr<BlobStore> {
        auto store = BlobStore::Open(config, &audit);
        REQUIRE(store);
        return *std::move(store);
    }
};

}  // namespace

TEST_CASE("Unreachable blobs are collected", "[garbage_collector]") {
    GcFixture fixture{};
    auto kept = CreateTestImage("kept");
    auto dropped = CreateTestImage("dropped");
    auto orphan = CreateTestBlob("orphan layer");
    fixture.PushImage("library/app", kept, "stable");
    fixture.PushImage("library/app", dropped, "old");
    REQUIRE(fixture.Local().PutBlob("library/app", orphan.digest, orphan.content));
    REQUIRE(fixture.Local().DeleteTag("library/app", "old"));

    SECTION("dry runs only report") {
        auto report = fixture.Collector().Run(/*dry_run=*/true);
        REQUIRE(report);
        CHECK(report->dry_run);
        CHECK(report->repositories == 1);
        CHECK(report->marked == 4);
        CHECK(report->removed == 5);
        CHECK(report->bytes_freed > 0);
        CHECK(fixture.IsStored(orphan.digest));
        CHECK(fixture.IsStored(dropped.manifest.digest));
    }

    SECTION("unreachable blobs are deleted") {
        auto const used = fixture.Store().UsedBytes();
        auto report = fixture.Collector().Run();
        REQUIRE(report);
        CHECK(report->marked == 4);
        CHECK(report->removed == 5);
        CHECK(report->failed == 0);
        CHECK(fixture.Store().UsedBytes() == used - report->bytes_freed);
        CHECK(std::find(report->unreachable.begin(),
                        report->unreachable.end(),
                        orphan.digest) != report->unreachable.end());

        CHECK(not fixture.IsStored(orphan.digest));
        CHECK(not fixture.IsStored(dropped.manifest.digest));
        CHECK(not fixture.IsStored(dropped.config.digest));
        CHECK(fixture.IsStored(kept.manifest.digest));
        CHECK(fixture.IsStored(kept.config.digest));
        for (auto const& layer : kept.layers) {
            CHECK(fixture.IsStored(layer.digest));
        }

        auto pulled = fixture.Local().GetManifest("library/app", "stable");
        REQUIRE(pulled);
        CHECK(pulled->digest == kept.manifest.digest);

        // nothing is left to collect
        auto again = fixture.Collector().Run();
        REQUIRE(again);
        CHECK(again->removed == 0);
    }
}

TEST_CASE("Moving a tag releases the previous image", "[garbage_collector]") {
    GcFixture fixture{};
    auto previous = CreateTestImage("previous");
    auto shared_layer = previous.layers[0];
    auto config = CreateTestBlob("current config");
    auto own_layer = CreateTestBlob("current layer");
    auto manifest = CreateImageManifest(config, {shared_layer, own_layer});
    TestImage current{config, {shared_layer, own_layer}, manifest};

    fixture.PushImage("library/app", previous, "latest");
    fixture.PushImage("library/app", current, "latest");

    auto report = fixture.Collector().Run();
    REQUIRE(report);
    CHECK(report->marked == 4);
    CHECK(report->removed == 3);
    CHECK(report->failed == 0);

    CHECK(fixture.IsStored(current.manifest.digest));
    CHECK(fixture.IsStored(current.config.digest));
    CHECK(fixture.IsStored(own_layer.digest));
    CHECK(fixture.IsStored(shared_layer.digest));
    CHECK(not fixture.IsStored(previous.manifest.digest));
    CHECK(not fixture.IsStored(previous.config.digest));
    CHECK(not fixture.IsStored(previous.layers[1].digest));

    auto pulled = fixture.Local().GetManifest("library/app", "latest");
    REQUIRE(pulled);
    CHECK(pulled->digest == current.manifest.digest);
    auto layer = fixture.Local().GetBlob("library/app", shared_layer.digest);
    REQUIRE(layer);
    CHECK(*layer == shared_layer.content);
}

TEST_CASE("Shared blobs and indices are kept", "[garbage_collector]") {
    GcFixture fixture{};
    auto amd64 = CreateTestImage("amd64");
    auto arm64 = CreateTestImage("arm64");
    auto index = CreateImageIndex({amd64.manifest, arm64.manifest});

    // children pushed by digest, the index by tag in another repository
    fixture.PushImage("library/app", amd64, amd64.manifest.digest.ToString());
    fixture.PushImage("library/app", arm64, arm64.manifest.digest.ToString());
    REQUIRE(fixture.Local().PutManifest(
        "library/multi", "latest", index.content, std::nullopt));

    auto report = fixture.Collector().Run();
    REQUIRE(report);
    CHECK(report->repositories == 2);
    CHECK(report->removed == 0);
    CHECK(fixture.IsStored(index.digest));
    CHECK(fixture.IsStored(arm64.layers[1].digest));
}

TEST_CASE("Collection aborts on a broken store", "[garbage_collector]") {
    GcFixture fixture{};
    auto image = CreateTestImage("broken");
    auto orphan = CreateTestBlob("orphan");
    fixture.PushImage("library/app", image, "latest");
    REQUIRE(fixture.Local().PutBlob("library/app", orphan.digest, orphan.content));

    SECTION("corrupted manifest") {
        REQUIRE(FileSystemAtomic::WriteFile(
                    fixture.Config().BlobPath(image.manifest.digest),
                    "corrupted") == 0);
        auto report = fixture.Collector().Run();
        REQUIRE(not report);
        CHECK(report.error().code == ErrorCode::CorruptionDetected);
    }

    SECTION("unreadable tag index") {
        REQUIRE(FileSystemAtomic::WriteFile(
                    fixture.Config().TagIndexPath("library/app"), "{") == 0);
        auto report = fixture.Collector().Run();
        REQUIRE(not report);
        CHECK(report.error().code == ErrorCode::IoFailure);
    }

    CHECK(fixture.IsStored(orphan.digest));
    CHECK(fixture.IsStored(image.config.digest));
}

TEST_CASE("Collection waits for held locks", "[garbage_collector]") {
    GcFixture fixture{};
    auto orphan = CreateTestBlob("locked orphan");
    REQUIRE(fixture.Local().PutBlob("library/app", orphan.digest, orphan.content));

    auto token = fixture.Locks().Acquire(LockKey::ForDigest(orphan.digest),
                                         LockMode::Shared);
    REQUIRE(token);
    GcScheduler scheduler{&fixture.Collector(), std::chrono::seconds{0}};
    scheduler.Trigger();
    CHECK(not scheduler.WaitForRuns(1, std::chrono::milliseconds{200}));
    CHECK(fixture.IsStored(orphan.digest));

    token->Release();
    REQUIRE(scheduler.WaitForRuns(1, std::chrono::seconds{5}));
    auto report = scheduler.LastReport();
    REQUIRE(report);
    CHECK(report->removed == 1);
    CHECK(not fixture.IsStored(orphan.digest));
}

TEST_CASE("Scheduled collection", "[gc_scheduler]") {
    GcFixture fixture{};
    auto orphan = CreateTestBlob("scheduled orphan");
    REQUIRE(fixture.Local().PutBlob("library/app", orphan.digest, orphan.content));

    SECTION("periodic runs") {
        GcScheduler scheduler{&fixture.Collector(), std::chrono::seconds{1}};
        REQUIRE(scheduler.WaitForRuns(2, std::chrono::seconds{10}));
        auto report = scheduler.LastReport();
        REQUIRE(report);
        CHECK(report->removed == 0);
        CHECK(not fixture.IsStored(orphan.digest));
    }

    SECTION("triggered runs without an interval") {
        GcScheduler scheduler{&fixture.Collector(), std::chrono::seconds{0}};
        CHECK(not scheduler.WaitForRuns(1, std::chrono::milliseconds{100}));
        scheduler.Trigger();
        REQUIRE(scheduler.WaitForRuns(1, std::chrono::seconds{5}));
        CHECK(scheduler.Runs() == 1);
        CHECK(not fixture.IsStored(orphan.digest));
        scheduler.Stop();
        scheduler.Trigger();
        CHECK(scheduler.Runs() == 1);
    }
}
