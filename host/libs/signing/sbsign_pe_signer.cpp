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

#include "host/libs/signing/sbsign_pe_signer.h"

#include <memory>
#include <string>
#include <utility>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"

namespace ukify {

SbsignPeSigner::SbsignPeSigner(std::string sbsign_binary,
                               std::shared_ptr<CertificateSigner> signer)
    : sbsign_binary_(std::move(sbsign_binary)), signer_(std::move(signer)) {}

Result<void> SbsignPeSigner::Sign(const std::string& input_path,
                                  const std::string& output_path) {
  UKIFY_EXPECT(signer_ != nullptr, "No Secure Boot signer");
  UKIFY_EXPECTF(FileExists(input_path), "Nothing to sign at \"{}\"",
                input_path);

  Command sbsign(sbsign_binary_);
  sbsign.AddParameter("--key");
  sbsign.AddParameter(signer_->KeyPath());
  sbsign.AddParameter("--cert");
  sbsign.AddParameter(signer_->CertificatePath());
  sbsign.AddParameter("--output");
  sbsign.AddParameter(output_path);
  sbsign.AddParameter(input_path);
  auto script = sbsign.AsBashScript();

  std::string out, err;
  int exit_code = RunWithManagedStdio(std::move(sbsign), &out, &err);
  if (exit_code != 0) {
    // Never leave a partially signed binary behind.
    RemoveFile(output_path);
    return UKIFY_ERRF("`{}` failed with code {}\nstdout: {}\nstderr: {}",
                      script, exit_code, out, err);
  }
  UKIFY_EXPECTF(FileExists(output_path), "`{}` did not produce \"{}\"", script,
                output_path);
  return {};
}

PeSignerFactory SbsignPeSignerFactory(const std::string& sbsign_binary) {
  return [sbsign_binary](std::shared_ptr<CertificateSigner> signer)
             -> Result<std::unique_ptr<PeSigner>> {
    UKIFY_EXPECT(signer != nullptr, "No Secure Boot signer");
    return std::unique_ptr<PeSigner>(
        new SbsignPeSigner(sbsign_binary, std::move(signer)));
  };
}

}  // namespace ukify
