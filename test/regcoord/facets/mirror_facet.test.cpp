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

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "src/regcoord/upstream/retry_config.hpp"
#include "test/utils/hermeticity/test_store_config.hpp"
#include "test/utils/registry/fake_upstream_registry.hpp"
#include "test/utils/registry/image_creator.hpp"

namespace {

[[nodiscard]] auto FastRetries() -> RetryConfig {
    auto config = RetryConfig::Builder{}
                      .SetInitialBackoffMs(1)
                      .SetMaxBackoffMs(5)
                      .SetMaxAttempts(3)
                      .Build();
    REQUIRE(config);
    return *config;
}

/// \brief Store and mirror over a fake upstream.
class MirrorFixture {
  public:
    explicit MirrorFixture(
        std::chrono::seconds tag_ttl = std::chrono::seconds{3600})
        : store_{Open(test_config_.Get(), audit_)},
          mirror_{store_.get(), &locks_, &audit_, upstream_, FastRetries(),
                  tag_ttl} {}

    [[nodiscard]] auto Mirror() noexcept -> MirrorFacet& { return mirror_; }

    [[nodiscard]] auto Upstream() noexcept -> FakeUpstreamRegistry& {
        return *upstream_;
    }

    [[nodiscard]] auto Store() noexcept -> BlobStore& { return *store_; }

    [[nodiscard]] auto Locks() noexcept -> LockManager& { return locks_; }

    [[nodiscard]] auto IsCached(Digest const& digest) const -> bool {
        return FileSystemManager::IsFile(test_config_.Get().BlobPath(digest));
    }

    [[nodiscard]] auto Config() const noexcept -> StoreConfig const& {
        return test_config_.Get();
    }

  private:
    TestStoreConfig test_config_{TestStoreConfig::Create()};
    AuditLog audit_{std::nullopt};
    LockManager locks_{};
    std::unique_ptr<BlobStore> store_;
    std::shared_ptr<FakeUpstreamRegistry> upstream_{
        std::make_shared<FakeUpstreamRegistry>()};
    MirrorFacet mirror_;

    [[nodiscard]] static auto Open(StoreConfig const& config,
                                   AuditLog const& audit)
        -> std::unique_ptr<BlobStore> {
        auto store = BlobStore::Open(config, &audit);
        REQUIRE(store);
        return *std::move(store);
    }
};

}  // namespace

TEST_CASE("Blobs are pulled through", "[mirror_facet]") {
    MirrorFixture fixture{};
    auto blob = CreateTestBlob("mirrored layer");
    fixture.Upstream().AddBlob(blob);

    SECTION("a miss is fetched once and then served from the store") {
        auto first = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(first);
        CHECK(*first == blob.content);
        CHECK(fixture.IsCached(blob.digest));

        auto second = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(second);
        CHECK(*second == blob.content);
        CHECK(fixture.Upstream().BlobFetches() == 1);
    }

    SECTION("head pulls the blob") {
        auto size = fixture.Mirror().HeadBlob("library/app", blob.digest);
        REQUIRE(size);
        CHECK(*size == blob.content.size());
        CHECK(fixture.IsCached(blob.digest));
    }

    SECTION("unknown blobs are not retried") {
        auto unknown = CreateTestBlob("unknown");
        auto result = fixture.Mirror().GetBlob("library/app", unknown.digest);
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::NotFound);
        CHECK(fixture.Upstream().BlobFetches() == 1);
    }

    SECTION("invalid repository names") {
        auto result = fixture.Mirror().GetBlob("Library/App", blob.digest);
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::InvalidName);
        CHECK(fixture.Upstream().BlobFetches() == 0);
    }
}

TEST_CASE("Upstream failures are retried", "[mirror_facet]") {
    MirrorFixture fixture{};
    auto blob = CreateTestBlob("flaky layer");
    fixture.Upstream().AddBlob(blob);

    SECTION("transient failures") {
        fixture.Upstream().FailNext(2);
        auto result = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(result);
        CHECK(fixture.Upstream().BlobFetches() == 3);
    }

    SECTION("attempts are bounded") {
        fixture.Upstream().SetOffline(true);
        auto result = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::UpstreamUnavailable);
        CHECK(result.error().IsRetryable());
        CHECK(fixture.Upstream().BlobFetches() == 3);
        CHECK(not fixture.IsCached(blob.digest));
    }
}

TEST_CASE("Concurrent misses are coalesced", "[mirror_facet]") {
    MirrorFixture fixture{};
    auto blob = CreateTestBlob("popular layer");
    fixture.Upstream().AddBlob(blob);
    fixture.Upstream().SetDelay(std::chrono::milliseconds{100});

    constexpr int kThreads = 8;
    std::atomic<int> served{};
    std::vector<std::thread> threads{};
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&fixture, &blob, &served]() {
            auto result = fixture.Mirror().GetBlob("library/app", blob.digest);
            if (result and *result == blob.content) {
                ++served;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(served.load() == kThreads);
    CHECK(fixture.Upstream().BlobFetches() == 1);
    CHECK(fixture.Store().BlobCount() == 1);
}

TEST_CASE("Corrupted content is never served", "[mirror_facet]") {
    MirrorFixture fixture{};
    auto blob = CreateTestBlob("verified layer");

    SECTION("corrupted upstream content is rejected") {
        fixture.Upstream().CorruptBlob(blob.digest, "tampered");
        auto result = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(not result);
        CHECK(result.error().code == ErrorCode::CorruptionDetected);
        CHECK(not fixture.IsCached(blob.digest));
    }

    SECTION("corrupted cache entries are quarantined and fetched again") {
        fixture.Upstream().AddBlob(blob);
        REQUIRE(fixture.Mirror().GetBlob("library/app", blob.digest));
        REQUIRE(FileSystemAtomic::WriteFile(
                    fixture.Config().BlobPath(blob.digest), "bit rot") == 0);

        auto corrupted = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(not corrupted);
        CHECK(corrupted.error().code == ErrorCode::CorruptionDetected);
        CHECK(not fixture.IsCached(blob.digest));
        CHECK(FileSystemManager::IsDirectory(fixture.Config().QuarantineRoot() /
                                             blob.digest.AlgorithmName()));

        auto refetched = fixture.Mirror().GetBlob("library/app", blob.digest);
        REQUIRE(refetched);
        CHECK(*refetched == blob.content);
        CHECK(fixture.Upstream().BlobFetches() == 2);
    }
}

TEST_CASE("Manifests are pulled through", "[mirror_facet]") {
    auto image = CreateTestImage("mirrored");

    SECTION("by tag, together with all referenced blobs") {
        MirrorFixture fixture{};
        fixture.Upstream().AddImage("library/app", image, "latest");
        auto manifest = fixture.Mirror().GetManifest("library/app", "latest");
        REQUIRE(manifest);
        CHECK(manifest->digest == image.manifest.digest);
        CHECK(manifest->content == image.manifest.content);
        CHECK(manifest->media_type == media_type::kOciManifest);
        CHECK(fixture.IsCached(image.manifest.digest));
        CHECK(fixture.IsCached(image.config.digest));
        for (auto const& layer : image.layers) {
            CHECK(fixture.IsCached(layer.digest));
        }

        // a fresh tag is served without asking the upstream
        auto again = fixture.Mirror().GetManifest("library/app", "latest");
        REQUIRE(again);
        CHECK(again->digest == image.manifest.digest);
        CHECK(fixture.Upstream().ManifestFetches() == 1);
    }

    SECTION("by digest") {
        MirrorFixture fixture{};
        fixture.Upstream().AddImage("library/app", image);
        auto manifest = fixture.Mirror().GetManifest(
            "library/app", image.manifest.digest.ToString());
        REQUIRE(manifest);
        CHECK(manifest->digest == image.manifest.digest);
        CHECK(fixture.IsCached(image.config.digest));

        auto repo = fixture.Locks().Acquire(
            LockKey::ForRepository("library/app"), LockMode::Shared);
        REQUIRE(repo);
        auto index = fixture.Store().ReadTagIndex("library/app", *repo);
        REQUIRE(index);
        CHECK(index->Linked().contains(image.manifest.digest));
    }

    SECTION("image indices cache their child manifests") {
        MirrorFixture fixture{};
        auto other = CreateTestImage("other platform");
        auto index = CreateImageIndex({image.manifest, other.manifest});
        fixture.Upstream().AddImage("library/app", image);
        fixture.Upstream().AddImage("library/app", other);
        fixture.Upstream().AddManifest(
            "library/app", index, media_type::kOciIndex, "multi");

        auto manifest = fixture.Mirror().GetManifest("library/app", "multi");
        REQUIRE(manifest);
        CHECK(manifest->media_type == media_type::kOciIndex);
        CHECK(fixture.IsCached(image.manifest.digest));
        CHECK(fixture.IsCached(other.manifest.digest));
    }

    SECTION("incomplete images are not linked") {
        MirrorFixture fixture{};
        fixture.Upstream().AddManifest("library/app",
                                       image.manifest,
                                       media_type::kOciManifest,
                                       "broken");
        auto manifest = fixture.Mirror().GetManifest("library/app", "broken");
        REQUIRE(not manifest);
        CHECK(manifest.error().code == ErrorCode::NotFound);
        CHECK(not FileSystemManager::Exists(
            fixture.Config().TagIndexPath("library/app")));
    }

    SECTION("invalid references") {
        MirrorFixture fixture{};
        auto manifest = fixture.Mirror().GetManifest("library/app", "-bad");
        REQUIRE(not manifest);
        CHECK(manifest.error().code == ErrorCode::InvalidName);
    }
}

TEST_CASE("Expired tags", "[mirror_facet]") {
    MirrorFixture fixture{std::chrono::seconds{0}};
    auto first = CreateTestImage("first");
    auto second = CreateTestImage("second");
    fixture.Upstream().AddImage("library/app", first, "latest");
    REQUIRE(fixture.Mirror().GetManifest("library/app", "latest"));

    SECTION("are refreshed from the upstream") {
        fixture.Upstream().AddImage("library/app", second, "latest");
        auto manifest = fixture.Mirror().GetManifest("library/app", "latest");
        REQUIRE(manifest);
        CHECK(manifest->digest == second.manifest.digest);
        CHECK(fixture.Upstream().ManifestFetches() == 2);
    }

    SECTION("are served stale while the upstream is down") {
        fixture.Upstream().SetOffline(true);
        auto manifest = fixture.Mirror().GetManifest("library/app", "latest");
        REQUIRE(manifest);
        CHECK(manifest->digest == first.manifest.digest);
    }

    SECTION("are not served when the upstream dropped them") {
        auto manifest = fixture.Mirror().GetManifest("library/app", "gone");
        REQUIRE(not manifest);
        CHECK(manifest.error().code == ErrorCode::NotFound);
    }
}
