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

#ifndef INCLUDED_SRC_UTILS_CPP_TMP_DIR_HPP
#define INCLUDED_SRC_UTILS_CPP_TMP_DIR_HPP

#include <filesystem>
#include <memory>
#include <utility>

/// \brief Uniquely named directory, removed with all its content when the
/// last reference goes away.
class TmpDir final {
  public:
    using Ptr = std::shared_ptr<TmpDir const>;

    TmpDir(TmpDir const&) = delete;
    auto operator=(TmpDir const&) -> TmpDir& = delete;
    TmpDir(TmpDir&& other) = delete;
    auto operator=(TmpDir&&) -> TmpDir& = delete;
    ~TmpDir() noexcept;

    [[nodiscard]] auto GetPath() const& noexcept
        -> std::filesystem::path const& {
        return tmp_dir_;
    }

    /// \brief Creates a completely unique directory in a given prefix path.
    [[nodiscard]] static auto Create(
        std::filesystem::path const& prefix) noexcept -> Ptr;

  private:
    explicit TmpDir(std::filesystem::path path) noexcept
        : tmp_dir_{std::move(path)} {}

    std::filesystem::path tmp_dir_;
};

#endif  // INCLUDED_SRC_UTILS_CPP_TMP_DIR_HPP
