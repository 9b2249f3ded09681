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

#include "common/libs/utils/base64.h"
#include "common/libs/utils/result_matchers.h"

namespace ukify {

TEST(Base64Test, EncodeNonMult3) {
  EXPECT_THAT(EncodeBase64("foobar1"), IsOkAndValue("Zm9vYmFyMQ=="));
}

TEST(Base64Test, EncodeEmpty) {
  EXPECT_THAT(EncodeBase64(""), IsOkAndValue(""));
}

TEST(Base64Test, DecodeNonMult3) {
  EXPECT_THAT(DecodeBase64("Zm9vYmFyMQ=="), IsOkAndValue("foobar1"));
}

TEST(Base64Test, DecodeKeepsTrailingZeroBytes) {
  std::string signature("\x01\xff\x00\x00", 4);
  auto encoded = EncodeBase64(signature);
  ASSERT_THAT(encoded, IsOkAndValue("Af8AAA=="));
  EXPECT_THAT(DecodeBase64(*encoded), IsOkAndValue(signature));
}

TEST(Base64Test, DecodeRejectsTruncatedInput) {
  EXPECT_THAT(DecodeBase64("Zm9vY"), IsError());
}

TEST(Base64Test, DecodeRejectsInvalidCharacters) {
  EXPECT_THAT(DecodeBase64("Zm9v!!!!"), IsError());
}

}  // namespace ukify
