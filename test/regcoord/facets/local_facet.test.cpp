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

#include "src/regcoord/facets/local_facet.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "test/utils/hermeticity/test_store_config.hpp"
#include "test/utils/registry/image_creator.hpp"

namespace {

class LocalFixture {
  public:
    explicit LocalFixture(LockManager::Options options = {})
        : locks_{options}, store_{Open(test_config_.Get(), audit_)} {}

    [[nodiscard]] auto Local() noexcept -> LocalFacet& { return *local_; }

    [[nodiscard]] auto Config() const noexcept -> StoreConfig const& {
        return test_config_.Get();
    }

    [[nodiscard]] auto Store() noexcept -> BlobStore& { return *store_; }

    [[nodiscard]] auto Locks() noexcept -> LockManager& { return locks_; }

    /// \brief Push config and layers of an image.
    void PushBlobs(TestImage const& image) {
        REQUIRE(local_->PutBlob(
            "library/app", image.config.digest, image.config.content));
        for (auto const& layer : image.layers) {
            REQUIRE(local_->PutBlob("library/app", layer.digest, layer.content));
        }
    }

    /// \brief Destroy the facet, as on shutdown.
    void Close() noexcept { local_.reset(); }

  private:
    TestStoreConfig test_config_{TestStoreConfig::Create()};
    AuditLog audit_{std::nullopt};
    LockManager locks_;
    std::unique_ptr<BlobStore> store_;
    std::unique_ptr<LocalFacet> local_{
        std::make_unique<LocalFacet>(store_.get(), &locks_)};

    [[nodiscard]] static auto Open(StoreConfig const& config,
                                   AuditLog const& audit)
        -> std::unique_ptr<BlobStore> {
        auto store = BlobStore::Open(config, &audit);
        REQUIRE(store);
        return *std::move(store);
    }
};

}  // namespace

TEST_CASE("Push and pull an image", "[local_facet]") {
    LocalFixture fixture{};
    auto image = CreateTestImage("pushed");

    SECTION("by tag") {
        fixture.PushBlobs(image);
        auto digest = fixture.Local().PutManifest(
            "library/app", "v1", image.manifest.content, std::nullopt);
        REQUIRE(digest);
        CHECK(*digest == image.manifest.digest);

        auto manifest = fixture.Local().GetManifest("library/app", "v1");
        REQUIRE(manifest);
        CHECK(manifest->digest == image.manifest.digest);
        CHECK(manifest->content == image.manifest.content);
        CHECK(manifest->media_type == media_type::kOciManifest);

        auto layer = fixture.Local().GetBlob("library/app",
                                             image.layers[0].digest);
        REQUIRE(layer);
        CHECK(*layer == image.layers[0].content);
        auto size = fixture.Local().HeadBlob("library/app",
                                             image.layers[1].digest);
        REQUIRE(size);
        CHECK(*size == image.layers[1].content.size());

        auto tags = fixture.Local().ListTags("library/app");
        REQUIRE(tags);
        CHECK(*tags == std::vector<std::string>{"v1"});
    }

    SECTION("by digest") {
        fixture.PushBlobs(image);
        auto digest = fixture.Local().PutManifest(
            "library/app",
            image.manifest.digest.ToString(),
            image.manifest.content,
            std::string{media_type::kOciManifest});
        REQUIRE(digest);
        auto manifest = fixture.Local().GetManifest(
            "library/app", image.manifest.digest.ToString());
        REQUIRE(manifest);
        CHECK(manifest->content == image.manifest.content);
        auto tags = fixture.Local().ListTags("library/app");
        REQUIRE(tags);
        CHECK(tags->empty());
    }

    SECTION("digest references must match the content") {
        fixture.PushBlobs(image);
        auto other = CreateTestBlob("other");
        auto digest = fixture.Local().PutManifest("library/app",
                                                  other.digest.ToString(),
                                                  image.manifest.content,
                                                  std::nullopt);
        REQUIRE(not digest);
        CHECK(digest.error().code == ErrorCode::InvalidDigest);
    }

    SECTION("manifests before their blobs are rejected") {
        auto digest = fixture.Local().PutManifest(
            "library/app", "v1", image.manifest.content, std::nullopt);
        REQUIRE(not digest);
        CHECK(digest.error().code == ErrorCode::DanglingReference);
        auto manifest = fixture.Local().GetManifest("library/app", "v1");
        REQUIRE(not manifest);
        CHECK(manifest.error().code == ErrorCode::NotFound);
    }

    SECTION("unparsable manifests are rejected") {
        auto digest = fixture.Local().PutManifest(
            "library/app", "v1", "not a manifest", std::nullopt);
        REQUIRE(not digest);
        CHECK(digest.error().code == ErrorCode::InvalidManifest);
    }

    SECTION("deleting tags") {
        fixture.PushBlobs(image);
        REQUIRE(fixture.Local().PutManifest(
            "library/app", "v1", image.manifest.content, std::nullopt));
        auto removed = fixture.Local().DeleteTag("library/app", "v1");
        REQUIRE(removed);
        CHECK(removed->digest == image.manifest.digest);
        auto missing = fixture.Local().DeleteTag("library/app", "v1");
        REQUIRE(not missing);
        CHECK(missing.error().code == ErrorCode::NotFound);
        CHECK(fixture.Local().GetManifest("library/app",
                                          image.manifest.digest.ToString()));
    }
}

TEST_CASE("Pulls never reach out", "[local_facet]") {
    LocalFixture fixture{};
    auto blob = CreateTestBlob("absent");
    auto result = fixture.Local().GetBlob("library/app", blob.digest);
    REQUIRE(not result);
    CHECK(result.error().code == ErrorCode::NotFound);

    auto manifest = fixture.Local().GetManifest("library/app", "latest");
    REQUIRE(not manifest);
    CHECK(manifest.error().code == ErrorCode::NotFound);
}

TEST_CASE("Corrupted blobs are quarantined on read", "[local_facet]") {
    LocalFixture fixture{};
    auto blob = CreateTestBlob("soon corrupted");
    REQUIRE(fixture.Local().PutBlob("library/app", blob.digest, blob.content));
    REQUIRE(FileSystemAtomic::WriteFile(fixture.Config().BlobPath(blob.digest),
                                        "garbage") == 0);

    auto result = fixture.Local().GetBlob("library/app", blob.digest);
    REQUIRE(not result);
    CHECK(result.error().code == ErrorCode::CorruptionDetected);
    CHECK(not FileSystemManager::Exists(
        fixture.Config().BlobPath(blob.digest)));

    // the blob may be pushed again
    auto ack = fixture.Local().PutBlob("library/app", blob.digest, blob.content);
    REQUIRE(ack);
    CHECK(ack->created);
}

TEST_CASE("Chunked uploads", "[local_facet]") {
    LocalFixture fixture{};
    auto blob = CreateTestBlob("first chunk|second chunk|last chunk");

    auto started = fixture.Local().StartUpload("library/app");
    REQUIRE(started);
    auto const uuid = started->uuid;
    CHECK(started->offset == 0);
    CHECK(fixture.Local().OpenUploads() == 1);

    auto first = fixture.Local().AppendChunk(uuid, "first chunk|");
    REQUIRE(first);
    CHECK(first->offset == 12);
    auto second = fixture.Local().AppendChunk(uuid, "second chunk|");
    REQUIRE(second);
    CHECK(second->offset == 25);
    auto status = fixture.Local().UploadStatusOf(uuid);
    REQUIRE(status);
    CHECK(status->offset == 25);
    CHECK(status->repository == "library/app");

    SECTION("commit with the last chunk") {
        auto ack = fixture.Local().CommitUpload(
            uuid, blob.digest, std::string{"last chunk"});
        REQUIRE(ack);
        CHECK(ack->created);
        auto content = fixture.Local().GetBlob("library/app", blob.digest);
        REQUIRE(content);
        CHECK(*content == blob.content);
        CHECK(fixture.Local().OpenUploads() == 0);
    }

    SECTION("commit with a wrong digest ends the session") {
        auto ack = fixture.Local().CommitUpload(uuid, blob.digest, std::nullopt);
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::InvalidDigest);
        CHECK(fixture.Local().OpenUploads() == 0);
        CHECK(not FileSystemManager::Exists(
            fixture.Config().UploadsRoot() / uuid));
        auto append = fixture.Local().AppendChunk(uuid, "last chunk");
        REQUIRE(not append);
        CHECK(append.error().code == ErrorCode::UploadUnknown);
    }

    SECTION("cancel removes the staging file") {
        REQUIRE(FileSystemManager::IsFile(fixture.Config().UploadsRoot() /
                                          uuid));
        REQUIRE(fixture.Local().CancelUpload(uuid));
        CHECK(not FileSystemManager::Exists(fixture.Config().UploadsRoot() /
                                            uuid));
        auto again = fixture.Local().CancelUpload(uuid);
        REQUIRE(not again);
        CHECK(again.error().code == ErrorCode::UploadUnknown);
        CHECK(fixture.Store().UsedBytes() == 0);
    }

    SECTION("open uploads are cancelled on shutdown") {
        fixture.Close();
        CHECK(not FileSystemManager::Exists(fixture.Config().UploadsRoot() /
                                            uuid));
    }
}

TEST_CASE("Busy commits keep the upload open", "[local_facet]") {
    LocalFixture fixture{
        LockManager::Options{.wait_timeout = std::chrono::milliseconds{50}}};
    auto blob = CreateTestBlob("contended upload|last chunk");

    auto started = fixture.Local().StartUpload("library/app");
    REQUIRE(started);
    auto const uuid = started->uuid;
    REQUIRE(fixture.Local().AppendChunk(uuid, "contended upload|"));

    {
        auto held = fixture.Locks().Acquire(LockKey::ForDigest(blob.digest),
                                            LockMode::Exclusive);
        REQUIRE(held);
        auto ack = fixture.Local().CommitUpload(
            uuid, blob.digest, std::string{"last chunk"});
        REQUIRE(not ack);
        CHECK(ack.error().code == ErrorCode::Busy);

        auto status = fixture.Local().UploadStatusOf(uuid);
        REQUIRE(status);
        CHECK(status->offset == 17);
        CHECK(fixture.Local().OpenUploads() == 1);
        CHECK(FileSystemManager::IsFile(fixture.Config().UploadsRoot() /
                                        uuid));
    }

    auto ack = fixture.Local().CommitUpload(
        uuid, blob.digest, std::string{"last chunk"});
    REQUIRE(ack);
    CHECK(ack->created);
    CHECK(fixture.Local().OpenUploads() == 0);
    auto content = fixture.Local().GetBlob("library/app", blob.digest);
    REQUIRE(content);
    CHECK(*content == blob.content);
}

TEST_CASE("Unknown uploads", "[local_facet]") {
    LocalFixture fixture{};
    auto blob = CreateTestBlob("never started");
    CHECK(not fixture.Local().AppendChunk("unknown", "data"));
    CHECK(not fixture.Local().UploadStatusOf("unknown"));
    auto ack = fixture.Local().CommitUpload("unknown", blob.digest, std::nullopt);
    REQUIRE(not ack);
    CHECK(ack.error().code == ErrorCode::UploadUnknown);
    CHECK(not fixture.Local().StartUpload("Not Valid"));
}
