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

#pragma once

#include <openssl/evp.h>

#include <memory>
#include <string>
#include <utility>

#include "common/libs/utils/result.h"

namespace ukify {

// Signs PCR policies. The public half is embedded in the UKI so that the
// policy signature can be checked at boot.
class PcrSigner {
 public:
  virtual ~PcrSigner() = default;

  // PEM encoded SubjectPublicKeyInfo ("-----BEGIN PUBLIC KEY-----").
  virtual Result<std::string> PublicKeyPem() const = 0;
  // DER encoded SubjectPublicKeyInfo.
  virtual Result<std::string> PublicKeyDer() const = 0;
  // RSASSA-PKCS1-v1_5 signature of an already computed SHA-256 digest.
  virtual Result<std::string> SignDigest(const std::string& digest) const = 0;
};

class RsaPcrSigner final : public PcrSigner {
 public:
  static Result<std::unique_ptr<RsaPcrSigner>> FromPem(
      const std::string& pem_private_key);
  static Result<std::unique_ptr<RsaPcrSigner>> FromPemFile(
      const std::string& path);

  Result<std::string> PublicKeyPem() const override;
  Result<std::string> PublicKeyDer() const override;
  Result<std::string> SignDigest(const std::string& digest) const override;

 private:
  RsaPcrSigner(EVP_PKEY* pkey) : pkey_(pkey, EVP_PKEY_free) {}

  std::unique_ptr<EVP_PKEY, void (*)(EVP_PKEY*)> pkey_;
};

// The material a PE signer needs to produce an Authenticode signature.
class CertificateSigner {
 public:
  virtual ~CertificateSigner() = default;

  virtual const std::string& CertificatePath() const = 0;
  virtual const std::string& KeyPath() const = 0;
};

// A PEM certificate and its PEM private key on disk. Loading checks that the
// key belongs to the certificate, it does not validate any chain.
class FileCertificateSigner final : public CertificateSigner {
 public:
  static Result<std::unique_ptr<FileCertificateSigner>> Load(
      const std::string& certificate_path, const std::string& key_path);

  const std::string& CertificatePath() const override {
    return certificate_path_;
  }
  const std::string& KeyPath() const override { return key_path_; }

 private:
  FileCertificateSigner(std::string certificate_path, std::string key_path)
      : certificate_path_(std::move(certificate_path)),
        key_path_(std::move(key_path)) {}

  std::string certificate_path_;
  std::string key_path_;
};

std::string CollectSslErrors();

}  // namespace ukify
