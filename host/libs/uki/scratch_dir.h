//
// Copyright (C) 2024 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <functional>
#include <string>
#include <utility>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"

namespace ukify {

using DirectoryRemover = std::function<Result<void>(const std::string&)>;

/**
 * A temporary directory owned by exactly one build.
 *
 * Remove() reports the outcome of the removal; the destructor removes the
 * directory if Remove() was never called successfully and logs a failure.
 */
class ScratchDir {
 public:
  static Result<ScratchDir> Create(
      const std::string& parent,
      DirectoryRemover remover = RecursivelyRemoveDirectory);

  ScratchDir(ScratchDir&& other) noexcept;
  ScratchDir& operator=(ScratchDir&& other) noexcept;
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;
  ~ScratchDir();

  const std::string& Path() const { return path_; }
  // "<scratch dir>/<name>"
  std::string File(const std::string& name) const;

  Result<void> Remove();

 private:
  ScratchDir(std::string path, DirectoryRemover remover)
      : path_(std::move(path)), remover_(std::move(remover)) {}

  void RemoveOrLog();

  std::string path_;
  DirectoryRemover remover_;
};

}  // namespace ukify
