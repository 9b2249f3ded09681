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

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/pe/pe_image.h"
#include "host/libs/pe/unittest/synthetic_pe.h"

namespace ukify {

using ::testing::HasSubstr;

TEST(PeImageTest, Pe32PlusHeaders) {
  auto data = SyntheticPeImage(
      true, 0x140000000, 0x1000,
      {{".text", 0x1000, std::string(0x30, '\x90')},
       {".sbat", 0x2000, "sbat,1,SBAT Version\n"}});
  auto image = PeImage::Parse(data);
  ASSERT_THAT(image, IsOk());
  EXPECT_TRUE(image->Is64Bit());
  EXPECT_EQ(image->ImageBase(), 0x140000000u);
  EXPECT_EQ(image->SectionAlignment(), 0x1000u);
  ASSERT_EQ(image->Sections().size(), 2u);
  EXPECT_EQ(image->Sections()[0].name, ".text");
  EXPECT_EQ(image->Sections()[0].virtual_address, 0x1000u);
  EXPECT_EQ(image->Sections()[0].virtual_size, 0x30u);
  EXPECT_EQ(image->Sections()[1].name, ".sbat");
}

TEST(PeImageTest, Pe32Headers) {
  auto data = SyntheticPeImage(false, 0x400000, 0x200,
                               {{".text", 0x1000, "code"}});
  auto image = PeImage::Parse(data);
  ASSERT_THAT(image, IsOk());
  EXPECT_FALSE(image->Is64Bit());
  EXPECT_EQ(image->ImageBase(), 0x400000u);
  EXPECT_EQ(image->SectionAlignment(), 0x200u);
}

TEST(PeImageTest, ReadSectionDataUsesVirtualSize) {
  auto data = SyntheticPeImage(true, 0x10000000, 0x1000,
                               {{".sbat", 0x1000, "sbat contents"}});
  auto image = PeImage::Parse(data);
  ASSERT_THAT(image, IsOk());
  const auto* sbat = image->FindSection(".sbat");
  ASSERT_NE(sbat, nullptr);
  EXPECT_THAT(image->ReadSectionData(*sbat), IsOkAndValue("sbat contents"));
  EXPECT_EQ(image->FindSection(".missing"), nullptr);
}

TEST(PeImageTest, EightCharacterSectionName) {
  auto data = SyntheticPeImage(true, 0x10000000, 0x1000,
                               {{".longnam", 0x1000, "x"}});
  auto image = PeImage::Parse(data);
  ASSERT_THAT(image, IsOk());
  EXPECT_NE(image->FindSection(".longnam"), nullptr);
}

TEST(PeImageTest, RejectsNonPe) {
  EXPECT_THAT(PeImage::Parse("not an image"), IsError());
  EXPECT_THAT(PeImage::Parse(""), IsError());

  auto data = SyntheticPeImage(true, 0x10000000, 0x1000, {});
  data[0x80] = 'X';
  EXPECT_THAT(PeImage::Parse(data),
              IsErrorAndMessage(HasSubstr("Missing PE signature")));
}

TEST(PeImageTest, RejectsTruncatedSectionTable) {
  auto data = SyntheticPeImage(true, 0x10000000, 0x1000,
                               {{".text", 0x1000, "code"}});
  data.resize(0x190);
  EXPECT_THAT(PeImage::Parse(data), IsError());
}

TEST(PeImageTest, OpenFile) {
  TemporaryDir dir;
  auto path = std::string(dir.path) + "/stub.efi";
  ASSERT_THAT(WriteNewFile(path, SyntheticPeImage(true, 0x10000000, 0x1000,
                                                  {{".text", 0x1000, "c"}})),
              IsOk());
  auto image = PeImage::Open(path);
  ASSERT_THAT(image, IsOk());
  EXPECT_EQ(image->Sections().size(), 1u);

  EXPECT_THAT(PeImage::Open(std::string(dir.path) + "/missing.efi"),
              IsError());
}

}  // namespace ukify
