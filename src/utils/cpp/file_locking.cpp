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

#include "src/utils/cpp/file_locking.hpp"

#include <cerrno>   // for errno
#include <cstdio>
#include <cstring>  // for strerror()
#include <exception>
#include <mutex>

#ifdef __unix__
#include <sys/file.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"

auto LockFile::Acquire(std::filesystem::path const& fspath, Mode mode) noexcept
    -> std::optional<LockFile> {
    return AcquireImpl(fspath, mode, /*blocking=*/true);
}

auto LockFile::TryAcquire(std::filesystem::path const& fspath,
                          Mode mode) noexcept -> std::optional<LockFile> {
    return AcquireImpl(fspath, mode, /*blocking=*/false);
}

auto LockFile::AcquireImpl(std::filesystem::path const& fspath,
                           Mode mode,
                           bool blocking) noexcept -> std::optional<LockFile> {
    static std::mutex lock_mutex{};
    try {
        std::unique_lock lock{lock_mutex};
        auto lock_file = GetLockFilePath(fspath);
        if (not lock_file) {
            return std::nullopt;
        }
        if (not FileSystemManager::CreateFile(*lock_file)) {
            Logger::Log(LogLevel::Error,
                        "LockFile: could not create file {}",
                        lock_file->string());
            return std::nullopt;
        }
        gsl::owner<FILE*> file_handle = std::fopen(lock_file->c_str(), "r");
        if (file_handle == nullptr) {
            Logger::Log(LogLevel::Error,
                        "LockFile: could not open descriptor for file {}",
                        lock_file->string());
            return std::nullopt;
        }
        int operation = mode == Mode::Shared ? LOCK_SH : LOCK_EX;
        if (not blocking) {
            operation |= LOCK_NB;  // NOLINT(hicpp-signed-bitwise)
        }
        if (flock(fileno(file_handle), operation) != 0) {
            auto const err = errno;
            if (err == EWOULDBLOCK) {
                Logger::Log(LogLevel::Debug,
                            "LockFile: {} is held by another process",
                            lock_file->string());
            }
            else {
                Logger::Log(
                    LogLevel::Error,
                    "LockFile: applying lock to file {} failed with:\n{}",
                    lock_file->string(),
                    strerror(err));
            }
            fclose(file_handle);
            return std::nullopt;
        }
        return LockFile(file_handle, *lock_file);
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error,
            "LockFile: acquiring file lock for path {} failed with:\n{}",
            fspath.string(),
            ex.what());
        return std::nullopt;
    }
}

LockFile::~LockFile() noexcept {
    if (file_handle_ != nullptr) {
        fclose(file_handle_);
        file_handle_ = nullptr;
    }
}

auto LockFile::GetLockFilePath(std::filesystem::path const& fspath) noexcept
    -> std::optional<std::filesystem::path> {
    try {
        auto filename = fspath.lexically_normal();
        if (not filename.is_absolute()) {
            filename = std::filesystem::absolute(filename);
        }
        if (not FileSystemManager::CreateDirectory(filename.parent_path())) {
            return std::nullopt;
        }
        return filename;
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error,
            "LockFile: defining lock file name for path {} failed with:\n{}",
            fspath.string(),
            ex.what());
        return std::nullopt;
    }
}

LockFile::LockFile(LockFile&& other) noexcept
    : file_handle_{other.file_handle_},
      lock_file_{std::move(other.lock_file_)} {
    other.file_handle_ = nullptr;
}

auto LockFile::operator=(LockFile&& other) noexcept -> LockFile& {
    if (this != &other) {
        if (file_handle_ != nullptr) {
            fclose(file_handle_);
        }
        file_handle_ = other.file_handle_;
        other.file_handle_ = nullptr;
        lock_file_ = std::move(other.lock_file_);
    }
    return *this;
}
