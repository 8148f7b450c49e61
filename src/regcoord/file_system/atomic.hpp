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

#ifndef INCLUDED_SRC_REGCOORD_FILE_SYSTEM_ATOMIC_HPP
#define INCLUDED_SRC_REGCOORD_FILE_SYSTEM_ATOMIC_HPP

#include <filesystem>
#include <string>
#include <string_view>

#include "src/utils/cpp/expected.hpp"

/// \brief Crash-safe file writes. Content is first written and synced to a
/// temporary file beside its destination; only a completed file is renamed
/// into place. Failures report the errno of the failing system call.
class FileSystemAtomic {
  public:
    /// \brief Infix of every temporary file name created here.
    static constexpr std::string_view kTmpInfix = ".tmp.";

    [[nodiscard]] static auto IsTemporaryName(
        std::string const& filename) noexcept -> bool;

    /// \brief Write content to a new temporary file in the directory of
    /// target and sync it to disk.
    /// \returns path of the temporary file, or the errno on failure, in which
    /// case no temporary file is left behind.
    [[nodiscard]] static auto StageFile(std::filesystem::path const& target,
                                        std::string const& content) noexcept
        -> expected<std::filesystem::path, int>;

    /// \brief Move a staged file to its destination. With no_clobber set, an
    /// existing destination is kept and the staged file is removed.
    /// \returns true if the destination was created by this call.
    [[nodiscard]] static auto CommitFile(std::filesystem::path const& staged,
                                         std::filesystem::path const& target,
                                         bool no_clobber) noexcept
        -> expected<bool, int>;

    /// \brief Stage and commit content, replacing any existing file.
    /// \returns 0 on success, errno otherwise.
    [[nodiscard]] static auto WriteFile(std::filesystem::path const& filename,
                                        std::string const& content) noexcept
        -> int;

    /// \brief Append content to an existing file and sync it.
    /// \returns 0 on success, errno otherwise.
    [[nodiscard]] static auto AppendToFile(
        std::filesystem::path const& filename,
        std::string const& content) noexcept -> int;
};

#endif  // INCLUDED_SRC_REGCOORD_FILE_SYSTEM_ATOMIC_HPP
