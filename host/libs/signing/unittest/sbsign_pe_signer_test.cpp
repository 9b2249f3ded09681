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

#include <sys/stat.h>

#include <memory>
#include <string>
#include <utility>

#include <android-base/file.h>
#include <android-base/strings.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/signing/sbsign_pe_signer.h"
#include "host/libs/signing/signers.h"
#include "host/libs/signing/unittest/test_keys.h"

namespace ukify {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

// Records its arguments and writes a marker followed by the input.
constexpr char kFakeSbsign[] = R"(#!/bin/sh
printf '%s\n' "$@" > "$(dirname "$0")/sbsign.args"
printf 'signed:' > "$6"
cat "$7" >> "$6"
)";

// Leaves a partial output behind before failing.
constexpr char kFailingSbsign[] = R"(#!/bin/sh
printf 'partial' > "$6"
echo "Invalid DOS header magic" >&2
exit 1
)";

class SbsignPeSignerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = dir_.path;
    auto keys = WriteTestKeyFiles(root_);
    ASSERT_THAT(keys, IsOk());
    auto signer = FileCertificateSigner::Load(keys->sb_cert, keys->sb_key);
    ASSERT_THAT(signer, IsOk());
    certificate_signer_ = std::move(*signer);
    input_ = Write("uki.unsigned.efi", "unsigned image");
    output_ = root_ + "/uki.efi";
  }

  std::string Write(const std::string& name, const std::string& contents,
                    mode_t mode = 0600) {
    auto path = root_ + "/" + name;
    EXPECT_THAT(WriteNewFile(path, contents, mode), IsOk());
    return path;
  }

  TemporaryDir dir_;
  std::string root_;
  std::shared_ptr<CertificateSigner> certificate_signer_;
  std::string input_;
  std::string output_;
};

TEST_F(SbsignPeSignerTest, RunsSbsign) {
  SbsignPeSigner signer(Write("sbsign", kFakeSbsign, 0700),
                        certificate_signer_);
  ASSERT_THAT(signer.Sign(input_, output_), IsOk());
  EXPECT_THAT(ReadFileContents(output_),
              IsOkAndValue("signed:unsigned image"));

  auto args = ReadFileContents(root_ + "/sbsign.args");
  ASSERT_THAT(args, IsOk());
  EXPECT_THAT(android::base::Split(android::base::Trim(*args), "\n"),
              ElementsAre("--key", certificate_signer_->KeyPath(), "--cert",
                          certificate_signer_->CertificatePath(), "--output",
                          output_, input_));
}

TEST_F(SbsignPeSignerTest, FailureRemovesPartialOutput) {
  SbsignPeSigner signer(Write("sbsign", kFailingSbsign, 0700),
                        certificate_signer_);
  EXPECT_THAT(signer.Sign(input_, output_),
              IsErrorAndMessage(HasSubstr("Invalid DOS header magic")));
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(SbsignPeSignerTest, MissingInput) {
  SbsignPeSigner signer(Write("sbsign", kFakeSbsign, 0700),
                        certificate_signer_);
  EXPECT_THAT(signer.Sign(root_ + "/missing.efi", output_), IsError());
  EXPECT_FALSE(FileExists(output_));
}

TEST_F(SbsignPeSignerTest, FactoryNeedsSigner) {
  auto factory = SbsignPeSignerFactory(root_ + "/sbsign");
  EXPECT_THAT(factory(nullptr), IsError());
  EXPECT_THAT(factory(certificate_signer_), IsOk());
}

}  // namespace ukify
