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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/result_matchers.h"
#include "host/libs/uki/section.h"

namespace ukify {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Pair;

TEST(SectionTest, Names) {
  EXPECT_EQ(SectionNameToString(SectionName::kOsRelease), ".osrel");
  EXPECT_EQ(SectionNameToString(SectionName::kCmdLine), ".cmdline");
  EXPECT_EQ(SectionNameToString(SectionName::kInitrd), ".initrd");
  EXPECT_EQ(SectionNameToString(SectionName::kSplash), ".splash");
  EXPECT_EQ(SectionNameToString(SectionName::kUname), ".uname");
  EXPECT_EQ(SectionNameToString(SectionName::kSbat), ".sbat");
  EXPECT_EQ(SectionNameToString(SectionName::kPcrPublicKey), ".pcrpkey");
  EXPECT_EQ(SectionNameToString(SectionName::kKernel), ".linux");
  EXPECT_EQ(SectionNameToString(SectionName::kPcrSig), ".pcrsig");
}

TEST(SectionListTest, RejectsDuplicates) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kCmdLine, "/a", true, true}), IsOk());
  ASSERT_THAT(list.Append({SectionName::kCmdLine, "/b", true, true}),
              IsErrorAndMessage(HasSubstr("already added")));
  ASSERT_EQ(list.Sections().size(), 1u);
  ASSERT_EQ(list.Find(SectionName::kCmdLine)->path, "/a");
}

TEST(SectionListTest, RejectsEmptyPath) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kInitrd, "", true, true}), IsError());
  ASSERT_TRUE(list.Sections().empty());
}

TEST(SectionListTest, MeasurementSignatureIsNeverMeasured) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kKernel, "/linux", true, true}),
              IsOk());
  ASSERT_THAT(list.Append({SectionName::kPcrSig, "/sig", true, true}),
              IsError());
  ASSERT_FALSE(list.Contains(SectionName::kPcrSig));
}

TEST(SectionListTest, MeasurementSignatureFollowsKernel) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kPcrSig, "/sig", false, true}),
              IsErrorAndMessage(HasSubstr("must follow the kernel")));
}

TEST(SectionListTest, SbatIsNeverAppended) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kSbat, "/sbat", true, true}),
              IsError());
  ASSERT_THAT(list.Append({SectionName::kSbat, "/sbat", true, false}), IsOk());
  ASSERT_TRUE(list.Appended().empty());
}

TEST(SectionListTest, NothingMeasuredAfterKernel) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kKernel, "/linux", true, true}),
              IsOk());
  ASSERT_THAT(list.Append({SectionName::kUname, "/uname", true, true}),
              IsErrorAndMessage(HasSubstr("cannot follow the kernel")));
}

TEST(SectionListTest, MeasuredAndAppended) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kCmdLine, "/cmdline", true, true}),
              IsOk());
  ASSERT_THAT(list.Append({SectionName::kSbat, "/sbat", true, false}), IsOk());
  ASSERT_THAT(list.Append({SectionName::kKernel, "/linux", true, true}),
              IsOk());
  ASSERT_THAT(list.Append({SectionName::kPcrSig, "/sig", false, true}),
              IsOk());

  EXPECT_THAT(list.Measured(),
              ElementsAre(Pair(SectionName::kCmdLine, "/cmdline"),
                          Pair(SectionName::kSbat, "/sbat"),
                          Pair(SectionName::kKernel, "/linux")));
  EXPECT_THAT(list.Appended(),
              ElementsAre(Field(&Section::name, SectionName::kCmdLine),
                          Field(&Section::name, SectionName::kKernel),
                          Field(&Section::name, SectionName::kPcrSig)));
  EXPECT_THAT(list.ValidateFinal(), IsOk());
}

TEST(SectionListTest, ValidateFinalNeedsSignatureLast) {
  SectionList list;
  ASSERT_THAT(list.Append({SectionName::kCmdLine, "/cmdline", true, true}),
              IsOk());
  ASSERT_THAT(list.Append({SectionName::kKernel, "/linux", true, true}),
              IsOk());
  EXPECT_THAT(list.ValidateFinal(), IsError());
}

}  // namespace ukify
