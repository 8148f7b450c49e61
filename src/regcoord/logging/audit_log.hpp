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

#ifndef INCLUDED_SRC_REGCOORD_LOGGING_AUDIT_LOG_HPP
#define INCLUDED_SRC_REGCOORD_LOGGING_AUDIT_LOG_HPP

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"
#include "src/regcoord/logging/logger.hpp"

/// \brief Append-only record of integrity events (corruption, quarantine).
/// Each event is one JSON object per line in the audit file, if configured,
/// and is always reported as a warning through the regular logger.
class AuditLog final {
  public:
    explicit AuditLog(std::optional<std::filesystem::path> file) noexcept
        : file_{std::move(file)} {}

    AuditLog(AuditLog const&) = delete;
    AuditLog(AuditLog&&) = delete;
    auto operator=(AuditLog const&) -> AuditLog& = delete;
    auto operator=(AuditLog&&) -> AuditLog& = delete;
    ~AuditLog() noexcept = default;

    /// \brief Record an event about a digest. Additional fields are merged
    /// into the JSON object written.
    void Record(std::string const& event,
                std::string const& digest,
                nlohmann::json const& details = nlohmann::json::object())
        const noexcept;

    [[nodiscard]] auto File() const noexcept
        -> std::optional<std::filesystem::path> const& {
        return file_;
    }

  private:
    std::optional<std::filesystem::path> file_;
    mutable std::mutex mutex_;
    Logger logger_{"Audit"};
};

#endif  // INCLUDED_SRC_REGCOORD_LOGGING_AUDIT_LOG_HPP
