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

#include "host/libs/signing/unittest/test_keys.h"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>

#include <memory>
#include <string>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"

namespace ukify {
namespace {

using BioPtr = std::unique_ptr<BIO, int (*)(BIO*)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)>;

Result<std::string> ReadBio(BIO* bio) {
  std::string out(BIO_pending(bio), ' ');
  auto read = BIO_read(bio, out.data(), out.size());
  UKIFY_EXPECTF(read >= 0 && static_cast<size_t>(read) == out.size(),
                "Unexpected amount of data read: {} != {}", read, out.size());
  return out;
}

Result<PkeyPtr> ParsePrivateKey(const std::string& pem) {
  BioPtr bio(BIO_new_mem_buf(pem.data(), pem.size()), BIO_free);
  UKIFY_EXPECT(bio.get() != nullptr, "BIO_new_mem_buf failed");
  PkeyPtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
               EVP_PKEY_free);
  UKIFY_EXPECT(pkey.get() != nullptr,
               "PEM_read_bio_PrivateKey failed: " << CollectSslErrors());
  return pkey;
}

}  // namespace

Result<std::string> GenerateRsaPrivateKeyPem(int bits) {
  std::unique_ptr<EVP_PKEY_CTX, void (*)(EVP_PKEY_CTX*)> ctx{
      EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr), EVP_PKEY_CTX_free};
  UKIFY_EXPECT(ctx.get() != nullptr,
               "EVP_PKEY_CTX_new_id failed: " << CollectSslErrors());
  UKIFY_EXPECT(EVP_PKEY_keygen_init(ctx.get()) > 0,
               "EVP_PKEY_keygen_init failed: " << CollectSslErrors());
  UKIFY_EXPECT(EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) > 0,
               "EVP_PKEY_CTX_set_rsa_keygen_bits failed: "
                   << CollectSslErrors());
  EVP_PKEY* raw_pkey = nullptr;
  UKIFY_EXPECT(EVP_PKEY_keygen(ctx.get(), &raw_pkey) > 0,
               "EVP_PKEY_keygen failed: " << CollectSslErrors());
  PkeyPtr pkey(raw_pkey, EVP_PKEY_free);

  BioPtr bo(BIO_new(BIO_s_mem()), BIO_free);
  UKIFY_EXPECT(bo.get() != nullptr, "BIO_new failed: " << CollectSslErrors());
  UKIFY_EXPECT(PEM_write_bio_PrivateKey(bo.get(), pkey.get(), nullptr,
                                        nullptr, 0, nullptr, nullptr) == 1,
               "PEM_write_bio_PrivateKey failed: " << CollectSslErrors());
  return UKIFY_EXPECT(ReadBio(bo.get()));
}

Result<std::string> SelfSignedCertificatePem(const std::string& key_pem,
                                             const std::string& common_name) {
  auto pkey = UKIFY_EXPECT(ParsePrivateKey(key_pem));
  std::unique_ptr<X509, void (*)(X509*)> cert(X509_new(), X509_free);
  UKIFY_EXPECT(cert.get() != nullptr, "X509_new failed");
  UKIFY_EXPECT(X509_set_version(cert.get(), 2) == 1, "X509_set_version");
  UKIFY_EXPECT(ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1) == 1,
               "ASN1_INTEGER_set");
  UKIFY_EXPECT(X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) != nullptr,
               "X509_gmtime_adj");
  UKIFY_EXPECT(
      X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 60 * 60) != nullptr,
      "X509_gmtime_adj");
  UKIFY_EXPECT(X509_set_pubkey(cert.get(), pkey.get()) == 1,
               "X509_set_pubkey failed: " << CollectSslErrors());

  X509_NAME* name = X509_get_subject_name(cert.get());
  UKIFY_EXPECT(
      X509_NAME_add_entry_by_txt(
          name, "CN", MBSTRING_ASC,
          reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1,
          0) == 1,
      "X509_NAME_add_entry_by_txt failed: " << CollectSslErrors());
  UKIFY_EXPECT(X509_set_issuer_name(cert.get(), name) == 1,
               "X509_set_issuer_name failed: " << CollectSslErrors());
  UKIFY_EXPECT(X509_sign(cert.get(), pkey.get(), EVP_sha256()) > 0,
               "X509_sign failed: " << CollectSslErrors());

  BioPtr bo(BIO_new(BIO_s_mem()), BIO_free);
  UKIFY_EXPECT(bo.get() != nullptr, "BIO_new failed: " << CollectSslErrors());
  UKIFY_EXPECT(PEM_write_bio_X509(bo.get(), cert.get()) == 1,
               "PEM_write_bio_X509 failed: " << CollectSslErrors());
  return UKIFY_EXPECT(ReadBio(bo.get()));
}

Result<TestKeyFiles> WriteTestKeyFiles(const std::string& dir) {
  TestKeyFiles files{dir + "/pcr.key", dir + "/db.key", dir + "/db.crt"};
  auto pcr_key = UKIFY_EXPECT(GenerateRsaPrivateKeyPem());
  auto sb_key = UKIFY_EXPECT(GenerateRsaPrivateKeyPem());
  auto sb_cert = UKIFY_EXPECT(SelfSignedCertificatePem(sb_key, "ukify test"));
  UKIFY_EXPECT(WriteNewFile(files.pcr_key, pcr_key));
  UKIFY_EXPECT(WriteNewFile(files.sb_key, sb_key));
  UKIFY_EXPECT(WriteNewFile(files.sb_cert, sb_cert));
  return files;
}

}  // namespace ukify
