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

#include "host/libs/uki/scratch_dir.h"

#include <string>
#include <utility>

#include <android-base/logging.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"

namespace ukify {

static constexpr char kScratchPrefix[] = "ukify";

Result<ScratchDir> ScratchDir::Create(const std::string& parent,
                                      DirectoryRemover remover) {
  UKIFY_EXPECT(remover != nullptr, "No directory remover");
  const auto& root = parent.empty() ? TempDirectoryRoot() : parent;
  auto path = UKIFY_EXPECT(CreateTempDirectory(root, kScratchPrefix),
                           "Could not create a scratch directory");
  return ScratchDir(std::move(path), std::move(remover));
}

ScratchDir::ScratchDir(ScratchDir&& other) noexcept
    : path_(std::move(other.path_)), remover_(std::move(other.remover_)) {
  other.path_.clear();
}

ScratchDir& ScratchDir::operator=(ScratchDir&& other) noexcept {
  if (this != &other) {
    RemoveOrLog();
    path_ = std::move(other.path_);
    remover_ = std::move(other.remover_);
    other.path_.clear();
  }
  return *this;
}

ScratchDir::~ScratchDir() { RemoveOrLog(); }

void ScratchDir::RemoveOrLog() {
  if (path_.empty()) {
    return;
  }
  auto removed = Remove();
  if (!removed.ok()) {
    LOG(ERROR) << removed.error().Message();
  }
}

std::string ScratchDir::File(const std::string& name) const {
  return path_ + "/" + name;
}

Result<void> ScratchDir::Remove() {
  if (path_.empty()) {
    return {};
  }
  UKIFY_EXPECTF(remover_(path_), "Failed to remove scratch directory \"{}\"",
                path_);
  path_.clear();
  return {};
}

}  // namespace ukify
