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

#include "src/regcoord/logging/audit_log.hpp"

#include <chrono>
#include <cstdio>
#include <exception>

#include "fmt/core.h"
#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"

void AuditLog::Record(std::string const& event,
                      std::string const& digest,
                      nlohmann::json const& details) const noexcept {
    try {
        auto entry = nlohmann::json::object();
        entry["time"] = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
        entry["event"] = event;
        entry["digest"] = digest;
        if (details.is_object()) {
            entry.update(details);
        }
        auto line = entry.dump();
        logger_.Emit(LogLevel::Warning, "{}", line);

        if (not file_) {
            return;
        }
        std::lock_guard lock{mutex_};
        if (gsl::owner<FILE*> file = std::fopen(file_->c_str(), "a")) {
            fmt::print(file, "{}\n", line);
            std::fclose(file);
        }
        else {
            logger_.Emit(LogLevel::Error,
                         "could not open audit file {}",
                         file_->string());
        }
    } catch (std::exception const& e) {
        logger_.Emit(LogLevel::Error,
                     "recording audit event {} for {} failed:\n{}",
                     event,
                     digest,
                     e.what());
    }
}
