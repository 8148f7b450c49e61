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

#ifndef INCLUDED_SRC_UTILS_CPP_FILE_LOCKING_HPP
#define INCLUDED_SRC_UTILS_CPP_FILE_LOCKING_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <utility>  // std::move

#include "gsl/gsl"

/* \brief Process-safe advisory file lock (flock) on a path.
 * The caller guarantees write access in the parent directory of the path, as
 * missing directories are created and the lock file is touched on acquire.
 * The lock is held for the lifetime of the object.
 */
class LockFile {
  public:
    enum class Mode : std::uint8_t { Shared, Exclusive };

    LockFile() = delete;

    /// \brief Close the file descriptor, which drops the lock.
    ~LockFile() noexcept;

    LockFile(LockFile const&) = delete;
    LockFile(LockFile&& other) noexcept;
    auto operator=(LockFile const&) = delete;
    auto operator=(LockFile&& other) noexcept -> LockFile&;

    /// \brief Acquire the lock, blocking until it is granted.
    /// \returns the lock file object on success, nullopt on failure.
    [[nodiscard]] static auto Acquire(std::filesystem::path const& fspath,
                                      Mode mode) noexcept
        -> std::optional<LockFile>;

    /// \brief Acquire the lock only if it is free right now.
    /// \returns the lock file object on success, nullopt if the lock is held
    /// elsewhere or could not be taken.
    [[nodiscard]] static auto TryAcquire(std::filesystem::path const& fspath,
                                         Mode mode) noexcept
        -> std::optional<LockFile>;

    [[nodiscard]] auto GetPath() const& noexcept
        -> std::filesystem::path const& {
        return lock_file_;
    }

  private:
    gsl::owner<FILE*> file_handle_{nullptr};
    std::filesystem::path lock_file_{};

    explicit LockFile(gsl::owner<FILE*> file_handle,
                      std::filesystem::path lock_file) noexcept
        : file_handle_{file_handle}, lock_file_{std::move(lock_file)} {};

    [[nodiscard]] static auto AcquireImpl(std::filesystem::path const& fspath,
                                          Mode mode,
                                          bool blocking) noexcept
        -> std::optional<LockFile>;

    [[nodiscard]] static auto GetLockFilePath(
        std::filesystem::path const& fspath) noexcept
        -> std::optional<std::filesystem::path>;
};

#endif  // INCLUDED_SRC_UTILS_CPP_FILE_LOCKING_HPP
