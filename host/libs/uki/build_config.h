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

#include <memory>
#include <string>

#include "common/libs/utils/result.h"

namespace ukify {

class CertificateSigner;
class PcrSigner;

inline constexpr char kDefaultOsName[] = "Linux";

/**
 * Every input of one UKI build. Filled in once by the caller and never
 * modified by the build.
 */
struct BuildConfig {
  // Boot stub the UKI is assembled on, e.g. linuxx64.efi.stub.
  std::string sd_stub_path;
  // Optional boot loader (e.g. systemd-bootx64.efi) signed next to the UKI.
  std::string sd_boot_path;
  std::string kernel_path;
  std::string initrd_path;
  std::string cmdline;
  // Optional os-release file. A minimal one is generated when empty.
  std::string os_release_path;
  // Used for the generated os-release.
  std::string os_name = kDefaultOsName;
  std::string version;
  // Optional BMP image. The bundled default is used when empty.
  std::string splash_path;

  // Pre-built PCR signer, or the PEM RSA private key to create one from.
  std::shared_ptr<PcrSigner> pcr_signer;
  std::string pcr_key_path;

  // Pre-built Secure Boot signer, or the PEM certificate and key to create
  // one from.
  std::shared_ptr<CertificateSigner> secure_boot_signer;
  std::string sb_cert_path;
  std::string sb_key_path;

  std::string out_sd_boot_path;
  std::string out_uki_path;

  // Scratch directories are created here. The system temporary directory
  // when empty.
  std::string scratch_parent_dir;
};

// Checks the inputs that have no dedicated resolution step. Signer material
// is checked by ResolveSigners.
Result<void> ValidateBuildConfig(const BuildConfig& config);

}  // namespace ukify
