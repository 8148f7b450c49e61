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

#ifndef INCLUDED_SRC_REGCOORD_LOCKING_LOCK_MANAGER_HPP
#define INCLUDED_SRC_REGCOORD_LOCKING_LOCK_MANAGER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "src/regcoord/common/error.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/utils/cpp/expected.hpp"

class LockManager;

/// \brief Move-only handle to locks granted by a LockManager: shared or
/// exclusive holds on a set of keys, or the store-wide lease. Held locks are
/// released when the token is destroyed. A token must not outlive the
/// manager that granted it.
class LockToken final {
    friend class LockManager;

  public:
    LockToken() noexcept = default;
    ~LockToken() noexcept { Release(); }

    LockToken(LockToken const&) = delete;
    auto operator=(LockToken const&) -> LockToken& = delete;
    LockToken(LockToken&& other) noexcept;
    auto operator=(LockToken&& other) noexcept -> LockToken&;

    [[nodiscard]] auto Id() const noexcept -> std::uint64_t { return id_; }

    /// \brief Whether this token still holds anything.
    [[nodiscard]] auto IsValid() const noexcept -> bool {
        return manager_ != nullptr;
    }

    [[nodiscard]] auto IsLease() const noexcept -> bool {
        return IsValid() and lease_;
    }

    /// \brief Whether this token allows access to key in the given mode.
    /// Exclusive holds cover shared access; the lease covers every key.
    [[nodiscard]] auto Covers(LockKey const& key,
                              LockMode mode) const noexcept -> bool;

    /// \brief Release all held locks; a no-op on released tokens.
    void Release() noexcept;

  private:
    LockManager* manager_{nullptr};
    std::uint64_t id_{};
    bool lease_{};
    std::vector<LockRequest> holds_;

    LockToken(LockManager* manager,
              std::uint64_t id,
              bool lease,
              std::vector<LockRequest> holds) noexcept
        : manager_{manager}, id_{id}, lease_{lease}, holds_{std::move(holds)} {}
};

/// \brief Grants shared and exclusive locks on digest and repository keys,
/// and the store-wide lease used by garbage collection.
///
/// Per key, requests are granted in arrival order; a shared request does not
/// overtake an earlier exclusive one. Multi-key requests take their keys in
/// the global key order, so two requests can never deadlock. A pending lease
/// holds back new requests until all held locks drained, except requests
/// that already waited longer than the grace period. All waits are bounded;
/// exceeding a bound yields a Busy error.
class LockManager final {
    friend class LockToken;

  public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        std::chrono::milliseconds wait_timeout{std::chrono::seconds{10}};
        std::chrono::milliseconds lease_grace{std::chrono::seconds{2}};
        std::chrono::milliseconds lease_timeout{std::chrono::seconds{60}};
    };

    explicit LockManager(Options options) noexcept;
    LockManager() noexcept : LockManager(Options{}) {}

    LockManager(LockManager const&) = delete;
    LockManager(LockManager&&) = delete;
    auto operator=(LockManager const&) -> LockManager& = delete;
    auto operator=(LockManager&&) -> LockManager& = delete;
    ~LockManager() noexcept = default;

    [[nodiscard]] auto Acquire(LockKey const& key, LockMode mode) noexcept
        -> expected<LockToken, Error>;

    /// \brief Acquire several keys under one token. Duplicate keys are merged
    /// (exclusive wins) and keys are taken in the global key order. On
    /// timeout, keys already taken are released again.
    [[nodiscard]] auto AcquireAll(std::vector<LockRequest> requests) noexcept
        -> expected<LockToken, Error>;

    /// \brief Acquire the store-wide lease: waits until no lock is held and
    /// then excludes all other requests until released.
    [[nodiscard]] auto AcquireLease() noexcept -> expected<LockToken, Error>;

    /// \brief Release the locks of a token id. Unknown or already released
    /// ids are ignored with a warning.
    void Release(std::uint64_t token_id) noexcept;

    /// \brief Number of keys currently held by any token.
    [[nodiscard]] auto HeldKeys() const noexcept -> std::size_t;

    /// \brief Number of requests waiting for a key.
    [[nodiscard]] auto QueuedRequests() const noexcept -> std::size_t;

    [[nodiscard]] auto IsLeaseHeld() const noexcept -> bool;

    [[nodiscard]] auto IsLeasePending() const noexcept -> bool;

    [[nodiscard]] auto GetOptions() const noexcept -> Options const& {
        return options_;
    }

  private:
    struct Waiter {
        std::uint64_t ticket{};
        LockMode mode{LockMode::Shared};
    };

    struct KeyState {
        std::size_t shared_holders{};
        bool exclusive_held{};
        std::deque<Waiter> queue;
    };

    struct TokenRecord {
        bool lease{};
        std::vector<LockRequest> holds;
    };

    Options const options_;
    Logger logger_{"LockManager"};

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<LockKey, KeyState> keys_;
    std::unordered_map<std::uint64_t, TokenRecord> tokens_;
    std::size_t active_holds_{};
    std::size_t queued_{};
    std::size_t lease_waiters_{};
    bool lease_held_{};
    std::uint64_t next_id_{1};

    [[nodiscard]] static auto Normalize(std::vector<LockRequest> requests)
        -> std::vector<LockRequest>;

    /// \brief Wait until a fresh request may pass a pending or held lease.
    [[nodiscard]] auto WaitForLeaseGate(std::unique_lock<std::mutex>* lock,
                                        Clock::time_point start,
                                        Clock::time_point deadline) noexcept
        -> bool;

    /// \brief Queue for and take a single key.
    [[nodiscard]] auto AcquireKey(std::unique_lock<std::mutex>* lock,
                                  LockRequest const& request,
                                  Clock::time_point deadline) noexcept -> bool;

    [[nodiscard]] static auto IsGrantable(KeyState const& state,
                                          Waiter const& waiter) noexcept
        -> bool;

    void ReleaseHoldsLocked(std::vector<LockRequest> const& holds) noexcept;

    [[nodiscard]] auto RegisterLocked(bool lease,
                                      std::vector<LockRequest> holds)
        -> LockToken;
};

#endif  // INCLUDED_SRC_REGCOORD_LOCKING_LOCK_MANAGER_HPP
