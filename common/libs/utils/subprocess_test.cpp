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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/subprocess.h"

namespace ukify {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

TEST(SubprocessTest, AddParameterConcatenates) {
  Command command("objcopy");
  command.AddParameter("--add-section");
  command.AddParameter(".cmdline", "=", "/tmp/cmdline");
  command.AddParameter("--change-section-vma");
  command.AddParameter(".cmdline", "=0x", 1000);
  ASSERT_EQ(command.GetShortName(), "objcopy");
  ASSERT_THAT(command.Arguments(),
              ElementsAre("objcopy", "--add-section", ".cmdline=/tmp/cmdline",
                          "--change-section-vma", ".cmdline=0x1000"));
  ASSERT_THAT(command.AsBashScript(), HasSubstr("--add-section"));
}

TEST(SubprocessTest, CapturesOutputAndExitCode) {
  Command command("/bin/sh");
  command.AddParameter("-c");
  command.AddParameter("echo out; echo err >&2; exit 3");
  std::string out, err;
  ASSERT_EQ(RunWithManagedStdio(std::move(command), &out, &err), 3);
  ASSERT_EQ(out, "out\n");
  ASSERT_EQ(err, "err\n");
}

TEST(SubprocessTest, SuccessWithoutCapture) {
  Command command("/bin/sh");
  command.AddParameter("-c");
  command.AddParameter("exit 0");
  ASSERT_EQ(RunWithManagedStdio(std::move(command), nullptr, nullptr), 0);
}

TEST(SubprocessTest, MissingExecutableFails) {
  Command command("/nonexistent/ukify-test-binary");
  std::string out, err;
  ASSERT_NE(RunWithManagedStdio(std::move(command), &out, &err), 0);
}

}  // namespace ukify
