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
#include "host/libs/pe/unittest/synthetic_pe.h"
#include "host/libs/uki/sbat_reader.h"

namespace ukify {

using ::testing::HasSubstr;

constexpr char kSbat[] =
    "sbat,1,SBAT Version,sbat,1,https://github.com/rhboot/shim/blob/main/"
    "SBAT.md\n"
    "systemd,1,The systemd Developers,systemd,255,https://systemd.io/\n";

class PeSbatReaderTest : public ::testing::Test {
 protected:
  std::string WriteStub(const std::string& sbat_data) {
    auto path = std::string(dir_.path) + "/stub.efi";
    EXPECT_THAT(WriteNewFile(path, SyntheticPeImage(
                                       true, 0x10000000, 0x1000,
                                       {{".text", 0x1000, "code"},
                                        {".sbat", 0x2000, sbat_data}})),
                IsOk());
    return path;
  }

  TemporaryDir dir_;
  PeSbatReader reader_;
};

TEST_F(PeSbatReaderTest, ReadsSection) {
  EXPECT_THAT(reader_.ReadSbat(WriteStub(kSbat)), IsOkAndValue(kSbat));
}

TEST_F(PeSbatReaderTest, NulsInsideVirtualSizeAreKept) {
  // systemd declares its SBAT data as a C string
  std::string sbat(kSbat, sizeof(kSbat));
  ASSERT_EQ(sbat.back(), '\0');
  auto stub = WriteStub(sbat + std::string(16, '\0'));
  EXPECT_THAT(reader_.ReadSbat(stub),
              IsOkAndValue(sbat + std::string(16, '\0')));
}

TEST_F(PeSbatReaderTest, FileAlignmentPaddingIsDropped) {
  auto sbat = reader_.ReadSbat(WriteStub(kSbat));
  ASSERT_THAT(sbat, IsOk());
  EXPECT_EQ(sbat->size(), sizeof(kSbat) - 1);
}

TEST_F(PeSbatReaderTest, ZeroFilledSectionIsCopied) {
  auto stub = WriteStub(std::string(8, '\0'));
  EXPECT_THAT(reader_.ReadSbat(stub), IsOkAndValue(std::string(8, '\0')));
}

TEST_F(PeSbatReaderTest, MissingSectionFails) {
  auto path = std::string(dir_.path) + "/nosbat.efi";
  ASSERT_THAT(WriteNewFile(path, SyntheticPeImage(true, 0x10000000, 0x1000,
                                                  {{".text", 0x1000, "c"}})),
              IsOk());
  EXPECT_THAT(reader_.ReadSbat(path),
              IsErrorAndMessage(HasSubstr("has no .sbat section")));
}

}  // namespace ukify
