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

#ifndef INCLUDED_SRC_REGCOORD_GC_GC_SCHEDULER_HPP
#define INCLUDED_SRC_REGCOORD_GC_GC_SCHEDULER_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <thread>

#include "gsl/gsl"
#include "src/regcoord/gc/garbage_collector.hpp"
#include "src/regcoord/logging/logger.hpp"

/// \brief Background thread running the garbage collector periodically and
/// on request. The thread is joined on Stop() or destruction.
class GcScheduler final {
  public:
    /// \param interval Time between runs; zero disables periodic runs, but
    /// triggered runs are still performed.
    GcScheduler(gsl::not_null<GarbageCollector*> const& collector,
                std::chrono::seconds interval) noexcept;

    GcScheduler(GcScheduler const&) = delete;
    GcScheduler(GcScheduler&&) = delete;
    auto operator=(GcScheduler const&) -> GcScheduler& = delete;
    auto operator=(GcScheduler&&) -> GcScheduler& = delete;
    ~GcScheduler() noexcept { Stop(); }

    /// \brief Request a run as soon as possible.
    void Trigger() noexcept;

    /// \brief Stop the thread, waiting for a run in progress to finish.
    void Stop() noexcept;

    /// \brief Number of runs finished, successful or not.
    [[nodiscard]] auto Runs() const noexcept -> std::size_t;

    /// \brief Report of the last successful run.
    [[nodiscard]] auto LastReport() const noexcept -> std::optional<GcReport>;

    /// \brief Wait until at least the given number of runs finished.
    /// \returns false on timeout.
    [[nodiscard]] auto WaitForRuns(std::size_t runs,
                                   std::chrono::milliseconds timeout) const
        noexcept -> bool;

  private:
    gsl::not_null<GarbageCollector*> collector_;
    std::chrono::seconds const interval_;
    Logger logger_{"GcScheduler"};

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool triggered_{};
    bool stopped_{};
    std::size_t runs_{};
    std::optional<GcReport> last_report_;
    std::thread thread_;

    void Loop() noexcept;
};

#endif  // INCLUDED_SRC_REGCOORD_GC_GC_SCHEDULER_HPP
