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

#include <openssl/sha.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result_matchers.h"
#include "host/libs/signing/signers.h"
#include "host/libs/signing/unittest/test_keys.h"

namespace ukify {

using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(RsaPcrSignerTest, ExportsPublicKey) {
  auto pem = GenerateRsaPrivateKeyPem();
  ASSERT_THAT(pem, IsOk());
  auto signer = RsaPcrSigner::FromPem(*pem);
  ASSERT_THAT(signer, IsOk());
  EXPECT_THAT((*signer)->PublicKeyPem(),
              IsOkAndValue(StartsWith("-----BEGIN PUBLIC KEY-----\n")));
  auto der = (*signer)->PublicKeyDer();
  ASSERT_THAT(der, IsOk());
  // SEQUENCE
  ASSERT_FALSE(der->empty());
  EXPECT_EQ((*der)[0], '\x30');
}

TEST(RsaPcrSignerTest, SignsOnlyDigests) {
  auto pem = GenerateRsaPrivateKeyPem();
  ASSERT_THAT(pem, IsOk());
  auto signer = RsaPcrSigner::FromPem(*pem);
  ASSERT_THAT(signer, IsOk());

  std::string digest(SHA256_DIGEST_LENGTH, '\x42');
  auto signature = (*signer)->SignDigest(digest);
  ASSERT_THAT(signature, IsOk());
  EXPECT_EQ(signature->size(), 256u);
  EXPECT_THAT((*signer)->SignDigest(digest), IsOkAndValue(*signature));

  EXPECT_THAT((*signer)->SignDigest("not a digest"),
              IsErrorAndMessage(HasSubstr("SHA-256")));
}

TEST(RsaPcrSignerTest, RejectsGarbage) {
  EXPECT_THAT(RsaPcrSigner::FromPem("garbage"), IsError());
  EXPECT_THAT(RsaPcrSigner::FromPemFile("/nonexistent/pcr.key"), IsError());
}

TEST(FileCertificateSignerTest, LoadsMatchingPair) {
  TemporaryDir dir;
  auto keys = WriteTestKeyFiles(dir.path);
  ASSERT_THAT(keys, IsOk());
  auto signer = FileCertificateSigner::Load(keys->sb_cert, keys->sb_key);
  ASSERT_THAT(signer, IsOk());
  EXPECT_EQ((*signer)->CertificatePath(), keys->sb_cert);
  EXPECT_EQ((*signer)->KeyPath(), keys->sb_key);
}

TEST(FileCertificateSignerTest, RejectsMismatchedPair) {
  TemporaryDir dir;
  auto keys = WriteTestKeyFiles(dir.path);
  ASSERT_THAT(keys, IsOk());
  EXPECT_THAT(FileCertificateSigner::Load(keys->sb_cert, keys->pcr_key),
              IsErrorAndMessage(HasSubstr("does not match")));
}

TEST(FileCertificateSignerTest, RejectsKeyAsCertificate) {
  TemporaryDir dir;
  auto keys = WriteTestKeyFiles(dir.path);
  ASSERT_THAT(keys, IsOk());
  EXPECT_THAT(FileCertificateSigner::Load(keys->sb_key, keys->sb_key),
              IsErrorAndMessage(HasSubstr("is not a PEM certificate")));
  EXPECT_THAT(FileCertificateSigner::Load("/nonexistent/db.crt", keys->sb_key),
              IsError());
}

}  // namespace ukify
