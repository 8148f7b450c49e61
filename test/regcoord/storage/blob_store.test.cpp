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

#include "src/regcoord/storage/blob_store.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "test/utils/hermeticity/test_store_config.hpp"
#include "test/utils/registry/image_creator.hpp"

namespace {

[[nodiscard]] auto OpenStore(StoreConfig const& config,
                             AuditLog const& audit)
    -> std::unique_ptr<BlobStore> {
    auto store = BlobStore::Open(config, &audit);
    REQUIRE(store);
    return *std::move(store);
}

[[nodiscard]] auto Lock(LockManager* locks,
                        Digest const& digest,
                        LockMode mode = LockMode::Exclusive) -> LockToken {
    auto token = locks->Acquire(LockKey::ForDigest(digest), mode);
    REQUIRE(token);
    return *std::move(token);
}

/// \brief Store all blobs of an image and lock its manifest for linking.
void StoreImageBlobs(BlobStore* store,
                     LockManager* locks,
                     TestImage const& image) {
    std::vector<TestBlob> blobs{image.config};
    blobs.insert(blobs.end(), image.layers.begin(), image.layers.end());
    for (auto const& blob : blobs) {
        auto token = Lock(locks, blob.digest);
        REQUIRE(store->Put(blob.digest, blob.content, token));
    }
}

/// \brief Take the locks for linking the image manifest into a repository.
[[nodiscard]] auto LockManifest(LockManager* locks,
                                TestImage const& image,
                                std::string const& repository) -> LockToken {
    auto manifest = Manifest::Parse(image.manifest.content);
    REQUIRE(manifest);
    auto token = locks->AcquireAll(BlobStore::ManifestLocks(
        repository, image.manifest.digest, manifest->RequiredDigests()));
    REQUIRE(token);
    return *std::move(token);
}

}  // namespace

TEST_CASE("Store and read blobs", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto blob = CreateTestBlob("layer content");

    SECTION("put then get") {
        auto token = Lock(&locks, blob.digest);
        auto ack = store->Put(blob.digest, blob.content, token);
        REQUIRE(ack);
        CHECK(ack->created);
        CHECK(store->BlobCount() == 1);
        CHECK(store->UsedBytes() == blob.content.size());

        auto has = store->Has(blob.digest, token);
        REQUIRE(has);
        CHECK(*has);
        auto size = store->Size(blob.digest, token);
        REQUIRE(size);
        CHECK(*size == blob.content.size());
        auto content = store->Get(blob.digest, token);
        REQUIRE(content);
        CHECK(*content == blob.content);
    }

    SECTION("identical content again is a no-op") {
        auto token = Lock(&locks, blob.digest);
        REQUIRE(store->Put(blob.digest, blob.content, token));
        auto again = store->Put(blob.digest, blob.content, token);
        REQUIRE(again);
        CHECK(not again->created);
        CHECK(store->BlobCount() == 1);
        CHECK(store->UsedBytes() == blob.content.size());
    }

    SECTION("content not matching its digest is rejected") {
        auto token = Lock(&locks, blob.digest);
        auto ack = store->Put(blob.digest, "other content", token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::InvalidDigest);
        CHECK(store->BlobCount() == 0);
        CHECK(store->UsedBytes() == 0);
        CHECK(not FileSystemManager::Exists(
            test_config.Get().BlobPath(blob.digest)));
    }

    SECTION("missing blobs") {
        auto token = Lock(&locks, blob.digest, LockMode::Shared);
        auto content = store->Get(blob.digest, token);
        REQUIRE(not content);
        CHECK(content.error().code == ErrorCode::NotFound);
        auto has = store->Has(blob.digest, token);
        REQUIRE(has);
        CHECK(not *has);
    }

    SECTION("operations require covering locks") {
        LockToken none{};
        auto put = store->Put(blob.digest, blob.content, none);
        REQUIRE(not put);
        CHECK(put.error().code == ErrorCode::IoFailure);

        auto shared = Lock(&locks, blob.digest, LockMode::Shared);
        CHECK(not store->Put(blob.digest, blob.content, shared));
        CHECK(store->Has(blob.digest, shared));

        auto other = CreateTestBlob("other");
        auto wrong_key = Lock(&locks, other.digest);
        CHECK(not store->Get(blob.digest, wrong_key));
        CHECK(not store->ListBlobs(wrong_key));
    }
}

TEST_CASE("Concurrent identical puts", "[blob_store]") {
    constexpr int kThreads = 8;
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto blob = CreateTestBlob("shared base layer");

    std::atomic<int> succeeded{};
    std::atomic<int> created{};
    std::vector<std::thread> threads{};
    threads.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            auto token = locks.Acquire(LockKey::ForDigest(blob.digest),
                                       LockMode::Exclusive);
            if (not token) {
                return;
            }
            auto ack = store->Put(blob.digest, blob.content, *token);
            if (ack) {
                ++succeeded;
                if (ack->created) {
                    ++created;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    CHECK(succeeded.load() == kThreads);
    CHECK(created.load() == 1);
    CHECK(store->BlobCount() == 1);
    CHECK(store->UsedBytes() == blob.content.size());
}

TEST_CASE("Store blobs from files", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto blob = CreateTestBlob("uploaded content");
    auto const source = test_config.Scratch() / "upload";
    REQUIRE(FileSystemAtomic::WriteFile(source, blob.content) == 0);

    SECTION("matching file is consumed") {
        auto token = Lock(&locks, blob.digest);
        auto ack = store->PutFile(blob.digest, source, token);
        REQUIRE(ack);
        CHECK(ack->created);
        CHECK(not FileSystemManager::Exists(source));
        auto content = store->Get(blob.digest, token);
        REQUIRE(content);
        CHECK(*content == blob.content);
    }

    SECTION("mismatching file is rejected") {
        auto other = CreateTestBlob("something else");
        auto token = Lock(&locks, other.digest);
        auto ack = store->PutFile(other.digest, source, token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::InvalidDigest);
        CHECK(store->BlobCount() == 0);
    }
}

TEST_CASE("Store quota", "[blob_store]") {
    auto first = CreateTestBlob(std::string(60, 'a'));
    auto second = CreateTestBlob(std::string(60, 'b'));
    auto test_config = TestStoreConfig::Create(100);
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);

    auto token = locks.AcquireAll(
        {LockRequest{LockKey::ForDigest(first.digest), LockMode::Exclusive},
         LockRequest{LockKey::ForDigest(second.digest), LockMode::Exclusive}});
    REQUIRE(token);
    REQUIRE(store->Put(first.digest, first.content, *token));
    auto ack = store->Put(second.digest, second.content, *token);
    REQUIRE(not ack);
    CHECK(ack.error().code == ErrorCode::CapacityExceeded);
    CHECK(store->UsedBytes() == first.content.size());
    CHECK(not FileSystemManager::Exists(
        test_config.Get().BlobPath(second.digest)));
}

TEST_CASE("Corrupted blobs", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    auto const audit_file = test_config.Scratch() / "audit.log";
    AuditLog audit{audit_file};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto blob = CreateTestBlob("pristine content");
    auto token = Lock(&locks, blob.digest);
    REQUIRE(store->Put(blob.digest, blob.content, token));

    auto const path = test_config.Get().BlobPath(blob.digest);
    REQUIRE(FileSystemAtomic::WriteFile(path, "bit rot") == 0);

    SECTION("reads are verified") {
        auto content = store->Get(blob.digest, token);
        REQUIRE(not content);
        CHECK(content.error().code == ErrorCode::CorruptionDetected);
        auto log = FileSystemManager::ReadFile(audit_file);
        REQUIRE(log);
        CHECK(log->find("corruption-detected") != std::string::npos);
    }

    SECTION("quarantine moves the blob aside") {
        auto target = store->Quarantine(blob.digest, token);
        REQUIRE(target);
        CHECK(FileSystemManager::IsFile(*target));
        CHECK(target->parent_path().parent_path() ==
              test_config.Get().QuarantineRoot());
        CHECK(not FileSystemManager::Exists(path));
        CHECK(store->BlobCount() == 0);

        // the blob can be stored again afterwards
        auto ack = store->Put(blob.digest, blob.content, token);
        REQUIRE(ack);
        CHECK(ack->created);
    }

    SECTION("different content under a stored digest is kept out") {
        auto ack = store->Put(blob.digest, blob.content, token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::CorruptionDetected);
        CHECK(FileSystemManager::ReadFile(path) == std::string{"bit rot"});
    }
}

TEST_CASE("Pre-commit hook", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto blob = CreateTestBlob("hooked content");
    auto token = Lock(&locks, blob.digest);

    std::optional<std::filesystem::path> staged{};
    store->SetPreCommitHook(
        [&staged](Digest const& /*unused*/, std::filesystem::path const& path) {
            staged = path;
            return false;
        });
    auto ack = store->Put(blob.digest, blob.content, token);
    REQUIRE(not ack);
    REQUIRE(staged);
    CHECK(FileSystemAtomic::IsTemporaryName(staged->filename().string()));
    CHECK(not FileSystemManager::Exists(*staged));
    CHECK(not FileSystemManager::Exists(
        test_config.Get().BlobPath(blob.digest)));
    CHECK(store->UsedBytes() == 0);

    store->SetPreCommitHook(nullptr);
    CHECK(store->Put(blob.digest, blob.content, token));
}

TEST_CASE("Manifests and tags", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto image = CreateTestImage("tagged");
    std::string const repository{"library/app"};

    SECTION("manifests with missing blobs are rejected") {
        auto token = LockManifest(&locks, image, repository);
        auto ack = store->PutManifest(repository,
                                      "latest",
                                      image.manifest.digest,
                                      image.manifest.content,
                                      std::nullopt,
                                      token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::DanglingReference);
        CHECK(not FileSystemManager::Exists(
            test_config.Get().BlobPath(image.manifest.digest)));
        CHECK(not FileSystemManager::Exists(
            test_config.Get().TagIndexPath(repository)));
    }

    SECTION("invalid names are rejected") {
        StoreImageBlobs(store.get(), &locks, image);
        auto token = LockManifest(&locks, image, "Bad Name");
        auto ack = store->PutManifest("Bad Name",
                                      "latest",
                                      image.manifest.digest,
                                      image.manifest.content,
                                      std::nullopt,
                                      token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::InvalidName);
    }

    SECTION("tag, resolve, list and delete") {
        StoreImageBlobs(store.get(), &locks, image);
        {
            auto token = LockManifest(&locks, image, repository);
            REQUIRE(store->PutManifest(repository,
                                       "latest",
                                       image.manifest.digest,
                                       image.manifest.content,
                                       std::nullopt,
                                       token));
            REQUIRE(store->PutManifest(repository,
                                       "1.0",
                                       image.manifest.digest,
                                       image.manifest.content,
                                       std::nullopt,
                                       token));
        }

        auto repo_token = locks.Acquire(LockKey::ForRepository(repository),
                                        LockMode::Exclusive);
        REQUIRE(repo_token);
        auto entry = store->ResolveTag(repository, "latest", *repo_token);
        REQUIRE(entry);
        CHECK(entry->digest == image.manifest.digest);
        CHECK(entry->updated > 0);

        auto tags = store->ListTags(repository, *repo_token);
        REQUIRE(tags);
        CHECK(*tags == std::vector<std::string>{"1.0", "latest"});

        auto removed = store->DeleteTag(repository, "latest", *repo_token);
        REQUIRE(removed);
        CHECK(removed->digest == image.manifest.digest);
        auto missing = store->ResolveTag(repository, "latest", *repo_token);
        REQUIRE(not missing);
        CHECK(missing.error().code == ErrorCode::NotFound);
        CHECK(not store->DeleteTag(repository, "latest", *repo_token));

        // the manifest itself stays
        auto manifest_token = Lock(&locks, image.manifest.digest);
        CHECK(store->Get(image.manifest.digest, manifest_token));
    }

    SECTION("manifests need locks on their blobs") {
        StoreImageBlobs(store.get(), &locks, image);
        auto token = locks.AcquireAll(
            {LockRequest{LockKey::ForDigest(image.manifest.digest),
                         LockMode::Exclusive},
             LockRequest{LockKey::ForRepository(repository),
                         LockMode::Exclusive}});
        REQUIRE(token);
        auto ack = store->PutManifest(repository,
                                      "latest",
                                      image.manifest.digest,
                                      image.manifest.content,
                                      std::nullopt,
                                      *token);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::IoFailure);
        CHECK(not FileSystemManager::Exists(
            test_config.Get().BlobPath(image.manifest.digest)));
        CHECK(not FileSystemManager::Exists(
            test_config.Get().TagIndexPath(repository)));
    }

    SECTION("manifests pushed by digest are linked") {
        StoreImageBlobs(store.get(), &locks, image);
        auto token = LockManifest(&locks, image, repository);
        REQUIRE(store->PutManifest(repository,
                                   std::nullopt,
                                   image.manifest.digest,
                                   image.manifest.content,
                                   std::nullopt,
                                   token));
        auto index = store->ReadTagIndex(repository, token);
        REQUIRE(index);
        CHECK(index->Tags().empty());
        CHECK(index->Linked().contains(image.manifest.digest));
    }

    SECTION("unknown repositories") {
        auto token = locks.Acquire(LockKey::ForRepository("unknown"),
                                   LockMode::Shared);
        REQUIRE(token);
        auto tags = store->ListTags("unknown", *token);
        REQUIRE(not tags);
        CHECK(tags.error().code == ErrorCode::NotFound);
    }
}

TEST_CASE("Blobs stay locked while a manifest is committed", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{LockManager::Options{
        .wait_timeout = std::chrono::milliseconds{50}}};
    auto store = OpenStore(test_config.Get(), audit);
    auto image = CreateTestImage("guarded");
    std::string const repository{"library/guarded"};
    StoreImageBlobs(store.get(), &locks, image);

    auto const layer = image.layers.front().digest;
    std::optional<ErrorCode> attempt{};
    store->SetPreCommitHook([&](Digest const& digest,
                                std::filesystem::path const& /*unused*/) {
        if (digest != image.manifest.digest) {
            return true;
        }
        // a collector would quarantine the layer now
        auto token = locks.Acquire(LockKey::ForDigest(layer),
                                   LockMode::Exclusive);
        if (token) {
            std::ignore = store->Quarantine(layer, *token);
            return true;
        }
        attempt = token.error().code;
        return true;
    });

    {
        auto token = LockManifest(&locks, image, repository);
        REQUIRE(store->PutManifest(repository,
                                   "latest",
                                   image.manifest.digest,
                                   image.manifest.content,
                                   std::nullopt,
                                   token));
    }
    store->SetPreCommitHook(nullptr);

    REQUIRE(attempt);
    CHECK(*attempt == ErrorCode::Busy);
    auto token = Lock(&locks, layer, LockMode::Shared);
    auto has = store->Has(layer, token);
    REQUIRE(has);
    CHECK(*has);
}

TEST_CASE("Store-wide operations require the lease", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    LockManager locks{};
    auto store = OpenStore(test_config.Get(), audit);
    auto image = CreateTestImage("listed");
    StoreImageBlobs(store.get(), &locks, image);
    {
        auto token = LockManifest(&locks, image, "listed/app");
        REQUIRE(store->PutManifest("listed/app",
                                   "latest",
                                   image.manifest.digest,
                                   image.manifest.content,
                                   std::nullopt,
                                   token));
    }

    auto lease = locks.AcquireLease();
    REQUIRE(lease);

    auto repositories = store->ListRepositories(*lease);
    REQUIRE(repositories);
    CHECK(*repositories == std::vector<std::string>{"listed/app"});

    auto blobs = store->ListBlobs(*lease);
    REQUIRE(blobs);
    CHECK(blobs->size() == 4);

    auto const used = store->UsedBytes();
    auto freed = store->Delete(image.config.digest, *lease);
    REQUIRE(freed);
    CHECK(*freed == image.config.content.size());
    CHECK(store->UsedBytes() == used - *freed);
    CHECK(store->BlobCount() == 3);

    auto again = store->Delete(image.config.digest, *lease);
    REQUIRE(not again);
    CHECK(again.error().code == ErrorCode::NotFound);
}

TEST_CASE("Opening a store", "[blob_store]") {
    auto test_config = TestStoreConfig::Create();
    AuditLog audit{std::nullopt};
    auto blob = CreateTestBlob("persisted content");

    SECTION("a store is owned by a single process") {
        auto store = OpenStore(test_config.Get(), audit);
        auto second = BlobStore::Open(test_config.Get(), &audit);
        REQUIRE(not second);
        CHECK(second.error().code == ErrorCode::Busy);
    }

    SECTION("reopening recovers usage and removes leftovers") {
        {
            LockManager locks{};
            auto store = OpenStore(test_config.Get(), audit);
            auto token = Lock(&locks, blob.digest);
            REQUIRE(store->Put(blob.digest, blob.content, token));
        }
        auto const path = test_config.Get().BlobPath(blob.digest);
        auto stale = FileSystemAtomic::StageFile(path, "half written");
        REQUIRE(stale);
        auto const upload = test_config.Get().UploadsRoot() / "session";
        REQUIRE(FileSystemAtomic::WriteFile(upload, "partial upload") == 0);

        auto store = OpenStore(test_config.Get(), audit);
        CHECK(store->BlobCount() == 1);
        CHECK(store->UsedBytes() == blob.content.size());
        CHECK(not FileSystemManager::Exists(*stale));
        CHECK(not FileSystemManager::Exists(upload));
        CHECK(FileSystemManager::IsDirectory(test_config.Get().UploadsRoot()));
    }

    SECTION("leftovers are removed under the lease") {
        LockManager locks{};
        auto store = OpenStore(test_config.Get(), audit);
        auto stale = FileSystemAtomic::StageFile(
            test_config.Get().TagIndexPath("some/repo"), "{}");
        REQUIRE(not stale);  // repository directory does not exist yet
        REQUIRE(FileSystemManager::CreateDirectory(
            test_config.Get().RepositoriesRoot() / "some/repo"));
        stale = FileSystemAtomic::StageFile(
            test_config.Get().TagIndexPath("some/repo"), "{}");
        REQUIRE(stale);

        auto lease = locks.AcquireLease();
        REQUIRE(lease);
        auto removed = store->RemoveTemporaries(*lease);
        REQUIRE(removed);
        CHECK(*removed == 1);
        CHECK(not FileSystemManager::Exists(*stale));
    }
}
