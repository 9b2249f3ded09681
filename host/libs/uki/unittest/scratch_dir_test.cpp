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

#include <string>
#include <utility>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/scopeguard.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/uki/scratch_dir.h"

namespace ukify {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

namespace {

Result<void> FailingRemover(const std::string&) {
  return UKIFY_ERR("Device or resource busy");
}

}  // namespace

TEST(ScratchDirTest, CreateAndRemove) {
  TemporaryDir parent;
  auto scratch = ScratchDir::Create(parent.path);
  ASSERT_THAT(scratch, IsOk());
  auto path = scratch->Path();
  EXPECT_THAT(path, StartsWith(std::string(parent.path) + "/ukify."));
  ASSERT_TRUE(DirectoryExists(path));
  ASSERT_THAT(WriteNewFile(scratch->File("cmdline"), "x"), IsOk());

  ASSERT_THAT(scratch->Remove(), IsOk());
  EXPECT_FALSE(FileExists(path));
  EXPECT_TRUE(scratch->Path().empty());
  // A second removal has nothing left to do.
  EXPECT_THAT(scratch->Remove(), IsOk());
}

TEST(ScratchDirTest, DestructorRemoves) {
  TemporaryDir parent;
  std::string path;
  {
    auto scratch = ScratchDir::Create(parent.path);
    ASSERT_THAT(scratch, IsOk());
    path = scratch->Path();
    ASSERT_THAT(WriteNewFile(scratch->File("file"), "x"), IsOk());
  }
  EXPECT_FALSE(FileExists(path));
  EXPECT_THAT(DirectoryContents(parent.path), IsOkAndValue(IsEmpty()));
}

TEST(ScratchDirTest, MoveTransfersOwnership) {
  TemporaryDir parent;
  auto scratch = ScratchDir::Create(parent.path);
  ASSERT_THAT(scratch, IsOk());
  auto path = scratch->Path();
  ScratchDir moved = std::move(*scratch);
  EXPECT_EQ(moved.Path(), path);
  EXPECT_TRUE(DirectoryExists(path));
  ASSERT_THAT(moved.Remove(), IsOk());
  EXPECT_FALSE(FileExists(path));
}

TEST(ScratchDirTest, UniquePerBuild) {
  TemporaryDir parent;
  auto first = ScratchDir::Create(parent.path);
  auto second = ScratchDir::Create(parent.path);
  ASSERT_THAT(first, IsOk());
  ASSERT_THAT(second, IsOk());
  EXPECT_NE(first->Path(), second->Path());
}

TEST(ScratchDirTest, RemoveReportsFailure) {
  TemporaryDir parent;
  auto scratch = ScratchDir::Create(parent.path, FailingRemover);
  ASSERT_THAT(scratch, IsOk());
  auto path = scratch->Path();
  EXPECT_THAT(scratch->Remove(),
              IsErrorAndMessage(HasSubstr("Device or resource busy")));
  // Still owned, so a later removal can retry.
  EXPECT_EQ(scratch->Path(), path);
  EXPECT_TRUE(DirectoryExists(path));
  ASSERT_THAT(RecursivelyRemoveDirectory(path), IsOk());
}

TEST(ScratchDirTest, DestructorLogsFailure) {
  std::vector<std::string> errors;
  android::base::SetLogger(
      [&errors](android::base::LogId, android::base::LogSeverity severity,
                const char*, const char*, unsigned int, const char* message) {
        if (severity >= android::base::ERROR) {
          errors.push_back(message);
        }
      });
  auto restore_logger = android::base::make_scope_guard(
      []() { android::base::SetLogger(android::base::StderrLogger); });

  TemporaryDir parent;
  std::string path;
  {
    auto scratch = ScratchDir::Create(parent.path, FailingRemover);
    ASSERT_THAT(scratch, IsOk());
    path = scratch->Path();
  }
  EXPECT_THAT(errors, Contains(HasSubstr("Device or resource busy")));
  EXPECT_TRUE(DirectoryExists(path));
  ASSERT_THAT(RecursivelyRemoveDirectory(path), IsOk());
}

TEST(ScratchDirTest, NullRemoverFails) {
  TemporaryDir parent;
  EXPECT_THAT(ScratchDir::Create(parent.path, nullptr), IsError());
  EXPECT_THAT(DirectoryContents(parent.path), IsOkAndValue(IsEmpty()));
}

TEST(ScratchDirTest, MissingParentFails) {
  EXPECT_THAT(ScratchDir::Create("/nonexistent/ukify-parent"), IsError());
}

}  // namespace ukify
