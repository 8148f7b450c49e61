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

#include "src/regcoord/gc/gc_scheduler.hpp"

#include <exception>

#include "src/regcoord/logging/log_level.hpp"

GcScheduler::GcScheduler(gsl::not_null<GarbageCollector*> const& collector,
                         std::chrono::seconds interval) noexcept
    : collector_{collector}, interval_{interval} {
    try {
        thread_ = std::thread([this]() { Loop(); });
    } catch (std::exception const& e) {
        logger_.Emit(LogLevel::Error,
                     "could not start garbage collection thread: {}",
                     e.what());
    }
}

void GcScheduler::Trigger() noexcept {
    {
        std::lock_guard lock{mutex_};
        triggered_ = true;
    }
    cv_.notify_all();
}

void GcScheduler::Stop() noexcept {
    {
        std::lock_guard lock{mutex_};
        stopped_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        try {
            thread_.join();
        } catch (std::exception const& e) {
            logger_.Emit(LogLevel::Warning,
                         "joining garbage collection thread failed: {}",
                         e.what());
        }
    }
}

auto GcScheduler::Runs() const noexcept -> std::size_t {
    std::lock_guard lock{mutex_};
    return runs_;
}

auto GcScheduler::LastReport() const noexcept -> std::optional<GcReport> {
    std::lock_guard lock{mutex_};
    return last_report_;
}

auto GcScheduler::WaitForRuns(std::size_t runs,
                              std::chrono::milliseconds timeout) const noexcept
    -> bool {
    std::unique_lock lock{mutex_};
    return cv_.wait_for(lock, timeout, [this, runs] { return runs_ >= runs; });
}

void GcScheduler::Loop() noexcept {
    auto const periodic = interval_.count() > 0;
    if (periodic) {
        logger_.Emit(LogLevel::Debug,
                     "collecting garbage every {} seconds",
                     interval_.count());
    }
    auto next = std::chrono::steady_clock::now() + interval_;
    std::unique_lock lock{mutex_};
    while (true) {
        auto wake = [this] { return stopped_ or triggered_; };
        if (periodic) {
            cv_.wait_until(lock, next, wake);
        }
        else {
            cv_.wait(lock, wake);
        }
        if (stopped_) {
            return;
        }
        if (not triggered_ and std::chrono::steady_clock::now() < next) {
            continue;
        }
        triggered_ = false;

        lock.unlock();
        auto report = collector_->Run();
        if (not report) {
            logger_.Emit(LogLevel::Warning,
                         "scheduled garbage collection failed: {}",
                         report.error().message);
        }
        lock.lock();

        ++runs_;
        if (report) {
            last_report_ = *std::move(report);
        }
        next = std::chrono::steady_clock::now() + interval_;
        cv_.notify_all();
    }
}
