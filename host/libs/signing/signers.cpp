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

#include "host/libs/signing/signers.h"

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/sha.h>
#include <openssl/x509.h>

#include <memory>
#include <sstream>
#include <string>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"

namespace ukify {

std::string CollectSslErrors() {
  std::stringstream errors;
  auto callback = [](const char* str, size_t len, void* stream) {
    ((std::stringstream*)stream)->write(str, len);
    return 1;  // success
  };
  ERR_print_errors_cb(callback, &errors);
  return errors.str();
}

namespace {

using BioPtr = std::unique_ptr<BIO, int (*)(BIO*)>;

Result<std::string> DrainBio(BIO* bio) {
  std::string out(BIO_pending(bio), ' ');
  auto read = BIO_read(bio, out.data(), out.size());
  UKIFY_EXPECTF(read >= 0 && static_cast<size_t>(read) == out.size(),
                "Unexpected amount of data read: {} != {}", read, out.size());
  return out;
}

}  // namespace

Result<std::unique_ptr<RsaPcrSigner>> RsaPcrSigner::FromPem(
    const std::string& pem_private_key) {
  BioPtr bo(BIO_new_mem_buf(pem_private_key.data(), pem_private_key.size()),
            BIO_free);
  UKIFY_EXPECT(bo.get() != nullptr,
               "BIO_new_mem_buf failed: " << CollectSslErrors());
  EVP_PKEY* pkey = UKIFY_EXPECT(
      PEM_read_bio_PrivateKey(bo.get(), nullptr, nullptr, nullptr),
      "Could not parse PCR signing key: " << CollectSslErrors());
  std::unique_ptr<RsaPcrSigner> signer(new RsaPcrSigner(pkey));
  UKIFY_EXPECTF(EVP_PKEY_base_id(pkey) == EVP_PKEY_RSA,
                "PCR signing key must be an RSA key, got type {}",
                EVP_PKEY_base_id(pkey));
  return signer;
}

Result<std::unique_ptr<RsaPcrSigner>> RsaPcrSigner::FromPemFile(
    const std::string& path) {
  auto pem = UKIFY_EXPECT(ReadFileContents(path));
  return UKIFY_EXPECTF(FromPem(pem), "Invalid PCR signing key \"{}\"", path);
}

Result<std::string> RsaPcrSigner::PublicKeyPem() const {
  BioPtr bo(BIO_new(BIO_s_mem()), BIO_free);
  UKIFY_EXPECT(bo.get() != nullptr, "BIO_new failed: " << CollectSslErrors());
  UKIFY_EXPECT(PEM_write_bio_PUBKEY(bo.get(), pkey_.get()) == 1,
               "PEM_write_bio_PUBKEY failed: " << CollectSslErrors());
  return UKIFY_EXPECT(DrainBio(bo.get()));
}

Result<std::string> RsaPcrSigner::PublicKeyDer() const {
  unsigned char* der = nullptr;
  int len = i2d_PUBKEY(pkey_.get(), &der);
  UKIFY_EXPECT(len > 0, "i2d_PUBKEY failed: " << CollectSslErrors());
  std::string out(reinterpret_cast<const char*>(der), len);
  OPENSSL_free(der);
  return out;
}

Result<std::string> RsaPcrSigner::SignDigest(const std::string& digest) const {
  UKIFY_EXPECT_EQ(digest.size(), static_cast<size_t>(SHA256_DIGEST_LENGTH),
                  "Only SHA-256 digests can be signed");
  std::unique_ptr<EVP_PKEY_CTX, void (*)(EVP_PKEY_CTX*)> ctx(
      EVP_PKEY_CTX_new(pkey_.get(), nullptr), EVP_PKEY_CTX_free);
  UKIFY_EXPECT(ctx.get() != nullptr,
               "EVP_PKEY_CTX_new failed: " << CollectSslErrors());
  UKIFY_EXPECT(EVP_PKEY_sign_init(ctx.get()) > 0,
               "EVP_PKEY_sign_init failed: " << CollectSslErrors());
  UKIFY_EXPECT(EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) > 0,
               "EVP_PKEY_CTX_set_rsa_padding failed: " << CollectSslErrors());
  UKIFY_EXPECT(EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha256()) > 0,
               "EVP_PKEY_CTX_set_signature_md failed: " << CollectSslErrors());

  const auto* in = reinterpret_cast<const unsigned char*>(digest.data());
  size_t length = 0;
  UKIFY_EXPECT(
      EVP_PKEY_sign(ctx.get(), nullptr, &length, in, digest.size()) > 0,
      "EVP_PKEY_sign failed: " << CollectSslErrors());
  std::string signature(length, '\0');
  UKIFY_EXPECT(
      EVP_PKEY_sign(ctx.get(),
                    reinterpret_cast<unsigned char*>(signature.data()),
                    &length, in, digest.size()) > 0,
      "EVP_PKEY_sign failed: " << CollectSslErrors());
  signature.resize(length);
  return signature;
}

Result<std::unique_ptr<FileCertificateSigner>> FileCertificateSigner::Load(
    const std::string& certificate_path, const std::string& key_path) {
  BioPtr cert_bio(BIO_new_file(certificate_path.c_str(), "r"), BIO_free);
  UKIFY_EXPECTF(cert_bio.get() != nullptr, "Could not open \"{}\": {}",
                certificate_path, CollectSslErrors());
  std::unique_ptr<X509, void (*)(X509*)> cert(
      PEM_read_bio_X509(cert_bio.get(), nullptr, nullptr, nullptr), X509_free);
  UKIFY_EXPECTF(cert.get() != nullptr,
                "\"{}\" is not a PEM certificate: {}", certificate_path,
                CollectSslErrors());

  BioPtr key_bio(BIO_new_file(key_path.c_str(), "r"), BIO_free);
  UKIFY_EXPECTF(key_bio.get() != nullptr, "Could not open \"{}\": {}",
                key_path, CollectSslErrors());
  std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> key(
      PEM_read_bio_PrivateKey(key_bio.get(), nullptr, nullptr, nullptr),
      EVP_PKEY_free);
  UKIFY_EXPECTF(key.get() != nullptr, "\"{}\" is not a PEM private key: {}",
                key_path, CollectSslErrors());

  UKIFY_EXPECTF(X509_check_private_key(cert.get(), key.get()) == 1,
                "Key \"{}\" does not match certificate \"{}\": {}", key_path,
                certificate_path, CollectSslErrors());

  return std::unique_ptr<FileCertificateSigner>(
      new FileCertificateSigner(certificate_path, key_path));
}

}  // namespace ukify
