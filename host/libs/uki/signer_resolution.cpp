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

#include "host/libs/uki/signer_resolution.h"

#include <memory>

#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"

namespace ukify {
namespace {

Result<std::shared_ptr<PcrSigner>> ResolvePcrSigner(
    const BuildConfig& config) {
  if (config.pcr_signer) {
    return config.pcr_signer;
  }
  UKIFY_EXPECT(!config.pcr_key_path.empty(),
               "Neither a PCR signer nor a PCR signing key was given");
  std::shared_ptr<PcrSigner> signer =
      UKIFY_EXPECT(RsaPcrSigner::FromPemFile(config.pcr_key_path));
  return signer;
}

Result<std::shared_ptr<CertificateSigner>> ResolveSecureBootSigner(
    const BuildConfig& config) {
  if (config.secure_boot_signer) {
    return config.secure_boot_signer;
  }
  UKIFY_EXPECT(!config.sb_cert_path.empty() || !config.sb_key_path.empty(),
               "Neither a Secure Boot signer nor a certificate and key were "
               "given");
  UKIFY_EXPECTF(!config.sb_cert_path.empty(),
                "Secure Boot key \"{}\" was given without a certificate",
                config.sb_key_path);
  UKIFY_EXPECTF(!config.sb_key_path.empty(),
                "Secure Boot certificate \"{}\" was given without a key",
                config.sb_cert_path);
  std::shared_ptr<CertificateSigner> signer = UKIFY_EXPECT(
      FileCertificateSigner::Load(config.sb_cert_path, config.sb_key_path));
  return signer;
}

}  // namespace

Result<ResolvedSigners> ResolveSigners(const BuildConfig& config) {
  ResolvedSigners signers;
  signers.pcr = UKIFY_EXPECT(ResolvePcrSigner(config));
  signers.secure_boot = UKIFY_EXPECT(ResolveSecureBootSigner(config));
  return signers;
}

}  // namespace ukify
