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

#include "src/regcoord/locking/lock_manager.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"

LockToken::LockToken(LockToken&& other) noexcept
    : manager_{other.manager_},
      id_{other.id_},
      lease_{other.lease_},
      holds_{std::move(other.holds_)} {
    other.manager_ = nullptr;
}

auto LockToken::operator=(LockToken&& other) noexcept -> LockToken& {
    if (this != &other) {
        Release();
        manager_ = other.manager_;
        id_ = other.id_;
        lease_ = other.lease_;
        holds_ = std::move(other.holds_);
        other.manager_ = nullptr;
    }
    return *this;
}

auto LockToken::Covers(LockKey const& key, LockMode mode) const noexcept
    -> bool {
    if (not IsValid()) {
        return false;
    }
    if (lease_) {
        return true;
    }
    return std::any_of(holds_.begin(), holds_.end(), [&](auto const& hold) {
        return hold.key == key and
               (hold.mode == LockMode::Exclusive or mode == LockMode::Shared);
    });
}

void LockToken::Release() noexcept {
    if (manager_ != nullptr) {
        manager_->Release(id_);
        manager_ = nullptr;
        holds_.clear();
    }
}

LockManager::LockManager(Options options) noexcept : options_{options} {}

auto LockManager::Acquire(LockKey const& key, LockMode mode) noexcept
    -> expected<LockToken, Error> {
    try {
        return AcquireAll({LockRequest{key, mode}});
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("acquiring lock failed: {}", e.what()));
    }
}

auto LockManager::AcquireAll(std::vector<LockRequest> requests) noexcept
    -> expected<LockToken, Error> {
    try {
        auto normalized = Normalize(std::move(requests));
        auto const start = Clock::now();
        auto const deadline = start + options_.wait_timeout;

        std::unique_lock lock{mutex_};
        if (not WaitForLeaseGate(&lock, start, deadline)) {
            return MakeError(
                ErrorCode::Busy,
                fmt::format("store lease held, gave up after {} ms",
                            options_.wait_timeout.count()));
        }

        std::vector<LockRequest> taken{};
        taken.reserve(normalized.size());
        for (auto const& request : normalized) {
            if (not AcquireKey(&lock, request, deadline)) {
                ReleaseHoldsLocked(taken);
                cv_.notify_all();
                return MakeError(
                    ErrorCode::Busy,
                    fmt::format("lock on {} not granted within {} ms",
                                request.key.ToString(),
                                options_.wait_timeout.count()));
            }
            taken.push_back(request);
        }
        return RegisterLocked(/*lease=*/false, std::move(taken));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("acquiring locks failed: {}", e.what()));
    }
}

auto LockManager::AcquireLease() noexcept -> expected<LockToken, Error> {
    try {
        auto const deadline = Clock::now() + options_.lease_timeout;
        std::unique_lock lock{mutex_};
        ++lease_waiters_;
        auto granted = cv_.wait_until(lock, deadline, [this] {
            return not lease_held_ and active_holds_ == 0 and queued_ == 0;
        });
        --lease_waiters_;
        if (not granted) {
            cv_.notify_all();
            return MakeError(
                ErrorCode::Busy,
                fmt::format("store lease not granted within {} ms",
                            options_.lease_timeout.count()));
        }
        lease_held_ = true;
        logger_.Emit(LogLevel::Debug, "store lease granted");
        return RegisterLocked(/*lease=*/true, {});
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("acquiring lease failed: {}", e.what()));
    }
}

void LockManager::Release(std::uint64_t token_id) noexcept {
    {
        std::unique_lock lock{mutex_};
        auto it = tokens_.find(token_id);
        if (it == tokens_.end()) {
            lock.unlock();
            logger_.Emit(LogLevel::Warning,
                         "ignoring release of unknown or already released "
                         "token {}",
                         token_id);
            return;
        }
        if (it->second.lease) {
            lease_held_ = false;
            logger_.Emit(LogLevel::Debug, "store lease released");
        }
        else {
            ReleaseHoldsLocked(it->second.holds);
        }
        tokens_.erase(it);
    }
    cv_.notify_all();
}

auto LockManager::HeldKeys() const noexcept -> std::size_t {
    std::unique_lock lock{mutex_};
    return static_cast<std::size_t>(
        std::count_if(keys_.begin(), keys_.end(), [](auto const& entry) {
            return entry.second.exclusive_held or
                   entry.second.shared_holders > 0;
        }));
}

auto LockManager::QueuedRequests() const noexcept -> std::size_t {
    std::unique_lock lock{mutex_};
    return queued_;
}

auto LockManager::IsLeaseHeld() const noexcept -> bool {
    std::unique_lock lock{mutex_};
    return lease_held_;
}

auto LockManager::IsLeasePending() const noexcept -> bool {
    std::unique_lock lock{mutex_};
    return lease_waiters_ > 0;
}

auto LockManager::Normalize(std::vector<LockRequest> requests)
    -> std::vector<LockRequest> {
    std::sort(requests.begin(),
              requests.end(),
              [](auto const& lhs, auto const& rhs) { return lhs.key < rhs.key; });
    std::vector<LockRequest> normalized{};
    normalized.reserve(requests.size());
    for (auto& request : requests) {
        if (not normalized.empty() and normalized.back().key == request.key) {
            if (request.mode == LockMode::Exclusive) {
                normalized.back().mode = LockMode::Exclusive;
            }
            continue;
        }
        normalized.push_back(std::move(request));
    }
    return normalized;
}

auto LockManager::WaitForLeaseGate(std::unique_lock<std::mutex>* lock,
                                   Clock::time_point start,
                                   Clock::time_point deadline) noexcept
    -> bool {
    auto const grace_end = start + options_.lease_grace;
    while (true) {
        auto const now = Clock::now();
        if (not lease_held_ and (lease_waiters_ == 0 or now >= grace_end)) {
            return true;
        }
        if (now >= deadline) {
            return false;
        }
        // a pending lease yields once the grace period is over, so wake up
        // then even without notification
        auto wake = deadline;
        if (not lease_held_) {
            wake = std::min(deadline, grace_end);
        }
        cv_.wait_until(*lock, wake);
    }
}

auto LockManager::AcquireKey(std::unique_lock<std::mutex>* lock,
                             LockRequest const& request,
                             Clock::time_point deadline) noexcept -> bool {
    Waiter const waiter{next_id_++, request.mode};
    auto& state = keys_[request.key];
    state.queue.push_back(waiter);
    ++queued_;

    auto granted = cv_.wait_until(*lock, deadline, [&] {
        return IsGrantable(keys_[request.key], waiter);
    });

    auto& current = keys_[request.key];
    auto it = std::find_if(
        current.queue.begin(), current.queue.end(), [&](auto const& w) {
            return w.ticket == waiter.ticket;
        });
    if (it != current.queue.end()) {
        current.queue.erase(it);
    }
    --queued_;

    if (not granted) {
        if (current.queue.empty() and current.shared_holders == 0 and
            not current.exclusive_held) {
            keys_.erase(request.key);
        }
        // the head of the queue may have changed
        cv_.notify_all();
        return false;
    }

    if (request.mode == LockMode::Exclusive) {
        current.exclusive_held = true;
    }
    else {
        ++current.shared_holders;
        // shared waiters queued right behind may be granted as well
        cv_.notify_all();
    }
    ++active_holds_;
    return true;
}

auto LockManager::IsGrantable(KeyState const& state,
                              Waiter const& waiter) noexcept -> bool {
    if (state.exclusive_held) {
        return false;
    }
    if (waiter.mode == LockMode::Exclusive) {
        return state.shared_holders == 0 and not state.queue.empty() and
               state.queue.front().ticket == waiter.ticket;
    }
    for (auto const& queued : state.queue) {
        if (queued.ticket == waiter.ticket) {
            return true;
        }
        if (queued.mode == LockMode::Exclusive) {
            return false;
        }
    }
    return false;
}

void LockManager::ReleaseHoldsLocked(
    std::vector<LockRequest> const& holds) noexcept {
    for (auto const& hold : holds) {
        auto it = keys_.find(hold.key);
        if (it == keys_.end()) {
            continue;
        }
        auto& state = it->second;
        if (hold.mode == LockMode::Exclusive) {
            state.exclusive_held = false;
        }
        else if (state.shared_holders > 0) {
            --state.shared_holders;
        }
        Expects(active_holds_ > 0);
        --active_holds_;
        if (state.queue.empty() and state.shared_holders == 0 and
            not state.exclusive_held) {
            keys_.erase(it);
        }
    }
}

auto LockManager::RegisterLocked(bool lease, std::vector<LockRequest> holds)
    -> LockToken {
    auto const id = next_id_++;
    tokens_.emplace(id, TokenRecord{lease, holds});
    return LockToken{this, id, lease, std::move(holds)};
}
