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

#include "src/regcoord/crypto/hasher.hpp"

#include <array>
#include <exception>
#include <fstream>
#include <string_view>
#include <variant>

#include "gsl/gsl"
#include "openssl/sha.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"

using VariantContext = std::variant<SHA256_CTX, SHA512_CTX>;
struct Hasher::ShaContext final : VariantContext {
    using VariantContext::VariantContext;
};

namespace {
inline constexpr int kOpenSslTrue = 1;
inline constexpr std::size_t kCharsPerByte = 2;
inline constexpr std::size_t kFileChunkSize = 64 * 1024;

[[nodiscard]] auto CreateShaContext(Hasher::HashType type) noexcept
    -> std::unique_ptr<Hasher::ShaContext> {
    switch (type) {
        case Hasher::HashType::SHA256:
            return std::make_unique<Hasher::ShaContext>(SHA256_CTX{});
        case Hasher::HashType::SHA512:
            return std::make_unique<Hasher::ShaContext>(SHA512_CTX{});
    }
    return nullptr;  // make gcc happy
}

template <typename TVisitor, typename... Args>
[[nodiscard]] auto Visit(gsl::not_null<VariantContext*> const& ctx,
                         Args&&... visitor_args) noexcept {
    try {
        return std::visit(TVisitor{std::forward<Args>(visitor_args)...}, *ctx);
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "Hasher::{} failed with an exception:\n{}",
                    TVisitor::kLogInfo,
                    e.what());
        Ensures(false);
    }
}

struct InitializeVisitor final {
    static constexpr std::string_view kLogInfo = "Initialize";

    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA256_CTX& ctx) const -> bool {
        return SHA256_Init(&ctx) == kOpenSslTrue;
    }
    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA512_CTX& ctx) const -> bool {
        return SHA512_Init(&ctx) == kOpenSslTrue;
    }
};

struct UpdateVisitor final {
    static constexpr std::string_view kLogInfo = "Update";

    explicit UpdateVisitor(gsl::not_null<std::string const*> const& data)
        : data_{*data} {}

    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA256_CTX& ctx) const -> bool {
        return SHA256_Update(&ctx, data_.data(), data_.size()) == kOpenSslTrue;
    }
    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA512_CTX& ctx) const -> bool {
        return SHA512_Update(&ctx, data_.data(), data_.size()) == kOpenSslTrue;
    }

  private:
    std::string const& data_;
};

struct FinalizeVisitor final {
    static constexpr std::string_view kLogInfo = "Finalize";

    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA256_CTX& ctx) const
        -> std::optional<std::string> {
        auto out = std::array<std::uint8_t, SHA256_DIGEST_LENGTH>{};
        if (SHA256_Final(out.data(), &ctx) == kOpenSslTrue) {
            return std::string{out.begin(), out.end()};
        }
        return std::nullopt;
    }
    // NOLINTNEXTLINE(google-runtime-references)
    [[nodiscard]] auto operator()(SHA512_CTX& ctx) const
        -> std::optional<std::string> {
        auto out = std::array<std::uint8_t, SHA512_DIGEST_LENGTH>{};
        if (SHA512_Final(out.data(), &ctx) == kOpenSslTrue) {
            return std::string{out.begin(), out.end()};
        }
        return std::nullopt;
    }
};
}  // namespace

Hasher::Hasher(std::unique_ptr<ShaContext> sha_ctx) noexcept
    : sha_ctx_{std::move(sha_ctx)} {}

Hasher::Hasher(Hasher&& other) noexcept = default;
auto Hasher::operator=(Hasher&& other) noexcept -> Hasher& = default;
Hasher::~Hasher() noexcept = default;

auto Hasher::Create(HashType type) noexcept -> std::optional<Hasher> {
    auto sha_ctx = CreateShaContext(type);
    if (sha_ctx != nullptr and Visit<InitializeVisitor>(sha_ctx.get())) {
        return std::optional<Hasher>{Hasher{std::move(sha_ctx)}};
    }
    return std::nullopt;
}

auto Hasher::HashData(HashType type, std::string const& data) noexcept
    -> std::optional<HashDigest> {
    auto hasher = Create(type);
    if (not hasher or not hasher->Update(data)) {
        return std::nullopt;
    }
    return std::move(*hasher).Finalize();
}

auto Hasher::HashFile(HashType type, std::filesystem::path const& path) noexcept
    -> std::optional<HashDigest> {
    auto hasher = Create(type);
    if (not hasher) {
        return std::nullopt;
    }
    try {
        std::ifstream in{path, std::ios::binary};
        if (not in.is_open()) {
            Logger::Log(LogLevel::Debug,
                        "Hasher: could not open {} for reading",
                        path.string());
            return std::nullopt;
        }
        std::string chunk(kFileChunkSize, '\0');
        while (in.good()) {
            in.read(chunk.data(),
                    gsl::narrow<std::streamsize>(chunk.size()));
            auto count = gsl::narrow<std::size_t>(in.gcount());
            if (count > 0 and not hasher->Update(chunk.substr(0, count))) {
                return std::nullopt;
            }
        }
        if (in.bad()) {
            Logger::Log(
                LogLevel::Error, "Hasher: reading {} failed", path.string());
            return std::nullopt;
        }
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "Hasher: hashing file {} failed with:\n{}",
                    path.string(),
                    e.what());
        return std::nullopt;
    }
    return std::move(*hasher).Finalize();
}

auto Hasher::Update(std::string const& data) noexcept -> bool {
    return Visit<UpdateVisitor>(sha_ctx_.get(), &data);
}

auto Hasher::Finalize() && noexcept -> std::optional<HashDigest> {
    if (auto hash = Visit<FinalizeVisitor>(sha_ctx_.get())) {
        return HashDigest{std::move(*hash)};
    }
    Logger::Log(LogLevel::Error, "Failed to compute hash.");
    return std::nullopt;
}

auto Hasher::GetHashLength() const noexcept -> std::size_t {
    return std::holds_alternative<SHA256_CTX>(*sha_ctx_)
               ? HexLength(HashType::SHA256)
               : HexLength(HashType::SHA512);
}

auto Hasher::HexLength(HashType type) noexcept -> std::size_t {
    switch (type) {
        case HashType::SHA256:
            return SHA256_DIGEST_LENGTH * kCharsPerByte;
        case HashType::SHA512:
            return SHA512_DIGEST_LENGTH * kCharsPerByte;
    }
    return 0;  // make gcc happy
}
