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

#ifndef INCLUDED_SRC_REGCOORD_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
#define INCLUDED_SRC_REGCOORD_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>  // for std::fopen
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#ifdef __unix__
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"

/// \brief Implements primitive file system functionality.
/// Catches all exceptions for use with exception-free callers.
class FileSystemManager {
  public:
    /// \brief Returns true if the directory was created or existed before.
    [[nodiscard]] static auto CreateDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        return CreateDirectoryImpl(dir) != CreationStatus::Failed;
    }

    /// \brief Returns true if the file was created or existed before.
    [[nodiscard]] static auto CreateFile(
        std::filesystem::path const& file) noexcept -> bool {
        return CreateFileImpl(file) != CreationStatus::Failed;
    }

    /// \brief Returns true if the file was created by this call.
    [[nodiscard]] static auto CreateFileExclusive(
        std::filesystem::path const& file) noexcept -> bool {
        return CreateFileImpl(file) == CreationStatus::Created;
    }

    /// \brief Move a file. With no_clobber set, an existing destination is
    /// never replaced and the call fails instead.
    [[nodiscard]] static auto Rename(std::filesystem::path const& src,
                                     std::filesystem::path const& dst,
                                     bool no_clobber = false) noexcept -> bool {
        if (no_clobber) {
            return link(src.c_str(), dst.c_str()) == 0 and
                   unlink(src.c_str()) == 0;
        }
        try {
            std::filesystem::rename(src, dst);
            return true;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveFile(
        std::filesystem::path const& file) noexcept -> bool {
        try {
            auto status = std::filesystem::symlink_status(file);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_regular_file(status) and
                not std::filesystem::is_symlink(status)) {
                return false;
            }
            return std::filesystem::remove(file);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing file from {}:\n{}",
                        file.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto RemoveDirectory(std::filesystem::path const& dir,
                                              bool recursively = false) noexcept
        -> bool {
        try {
            auto status = std::filesystem::symlink_status(dir);
            if (not std::filesystem::exists(status)) {
                return true;
            }
            if (not std::filesystem::is_directory(status)) {
                return false;
            }
            if (recursively) {
                return (std::filesystem::remove_all(dir) !=
                        static_cast<std::uintmax_t>(-1));
            }
            return std::filesystem::remove(dir);
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "removing directory {}:\n{}",
                        dir.string(),
                        e.what());
            return false;
        }
    }

    [[nodiscard]] static auto Exists(std::filesystem::path const& path) noexcept
        -> bool {
        auto const status = SymlinkStatus(path, "checking existence of");
        return status and std::filesystem::exists(*status);
    }

    [[nodiscard]] static auto IsFile(std::filesystem::path const& file) noexcept
        -> bool {
        auto const status = SymlinkStatus(file, "checking file type of");
        return status and std::filesystem::is_regular_file(*status);
    }

    [[nodiscard]] static auto IsDirectory(
        std::filesystem::path const& dir) noexcept -> bool {
        auto const status = SymlinkStatus(dir, "checking directory type of");
        return status and std::filesystem::is_directory(*status);
    }

    /// \brief Size of a regular file in bytes, nullopt if it is missing or
    /// not a regular file.
    [[nodiscard]] static auto FileSize(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::uintmax_t> {
        if (not IsFile(file)) {
            return std::nullopt;
        }
        std::error_code ec{};
        auto const size = std::filesystem::file_size(file, ec);
        if (ec) {
            Logger::Log(LogLevel::Error,
                        "obtaining size of file {} failed: {}",
                        file.string(),
                        ec.message());
            return std::nullopt;
        }
        return size;
    }

    /// \brief Read a whole regular file. Blobs and manifests are read with
    /// this, so the content is kept binary.
    [[nodiscard]] static auto ReadFile(
        std::filesystem::path const& file) noexcept
        -> std::optional<std::string> {
        if (not IsFile(file)) {
            Logger::Log(LogLevel::Debug,
                        "{} can not be read because it is not a file.",
                        file.string());
            return std::nullopt;
        }
        try {
            std::ifstream in{file, std::ios::binary};
            if (not in.is_open()) {
                Logger::Log(
                    LogLevel::Error, "opening file {} failed", file.string());
                return std::nullopt;
            }
            std::string content{};
            std::string chunk(kChunkSize, '\0');
            while (in.read(chunk.data(),
                           gsl::narrow<std::streamsize>(chunk.size())) or
                   in.gcount() > 0) {
                content.append(chunk, 0, gsl::narrow<std::size_t>(in.gcount()));
            }
            if (in.bad()) {
                Logger::Log(
                    LogLevel::Error, "reading file {} failed", file.string());
                return std::nullopt;
            }
            return content;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error,
                        "reading file {}:\n{}",
                        file.string(),
                        e.what());
            return std::nullopt;
        }
    }

    /// \brief Visit all regular files below a directory, passing their path
    /// relative to dir. A missing directory has no files.
    [[nodiscard]] static auto ReadFilesRecursive(
        std::filesystem::path const& dir,
        std::function<bool(std::filesystem::path const&)> const&
            use_file) noexcept -> bool {
        try {
            if (not IsDirectory(dir)) {
                return not Exists(dir);
            }
            for (auto const& entry :
                 std::filesystem::recursive_directory_iterator{dir}) {
                if (entry.is_regular_file() and
                    not use_file(entry.path().lexically_relative(dir))) {
                    return false;
                }
            }
            return true;
        } catch (std::exception const& ex) {
            Logger::Log(LogLevel::Error,
                        "reading directory {} recursively failed:\n{}",
                        dir.string(),
                        ex.what());
            return false;
        }
    }

  private:
    enum class CreationStatus : std::uint8_t { Created, Exists, Failed };

    static constexpr std::size_t kChunkSize{64 * 1024};

    [[nodiscard]] static auto SymlinkStatus(std::filesystem::path const& path,
                                            std::string_view action) noexcept
        -> std::optional<std::filesystem::file_status> {
        std::error_code ec{};
        auto status = std::filesystem::symlink_status(path, ec);
        if (ec and ec != std::errc::no_such_file_or_directory and
            ec != std::errc::not_a_directory) {
            Logger::Log(LogLevel::Error,
                        "{} path {} failed: {}",
                        action,
                        path.string(),
                        ec.message());
            return std::nullopt;
        }
        return status;
    }

    /// \brief Race condition free directory creation.
    /// Solves the TOCTOU issue.
    [[nodiscard]] static auto CreateDirectoryImpl(
        std::filesystem::path const& dir) noexcept -> CreationStatus {
        try {
            if (std::filesystem::is_directory(
                    std::filesystem::symlink_status(dir))) {
                return CreationStatus::Exists;
            }
            if (std::filesystem::create_directories(dir)) {
                return CreationStatus::Created;
            }
            // Another thread may have created the directory right after the
            // existence check above.
            if (std::filesystem::is_directory(
                    std::filesystem::symlink_status(dir))) {
                return CreationStatus::Exists;
            }
            return CreationStatus::Failed;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return CreationStatus::Failed;
        }
    }

    /// \brief Race condition free file creation.
    /// Solves the TOCTOU issue via C11's std::fopen.
    [[nodiscard]] static auto CreateFileImpl(
        std::filesystem::path const& file) noexcept -> CreationStatus {
        try {
            if (std::filesystem::is_regular_file(
                    std::filesystem::symlink_status(file))) {
                return CreationStatus::Exists;
            }
            if (gsl::owner<FILE*> fp = std::fopen(file.c_str(), "wx")) {
                std::fclose(fp);
                return CreationStatus::Created;
            }
            if (std::filesystem::is_regular_file(
                    std::filesystem::symlink_status(file))) {
                return CreationStatus::Exists;
            }
            return CreationStatus::Failed;
        } catch (std::exception const& e) {
            Logger::Log(LogLevel::Error, e.what());
            return CreationStatus::Failed;
        }
    }
};

#endif  // INCLUDED_SRC_REGCOORD_FILE_SYSTEM_FILE_SYSTEM_MANAGER_HPP
