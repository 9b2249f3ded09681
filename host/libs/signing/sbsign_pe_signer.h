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
#include "host/libs/signing/signers.h"
#include "host/libs/uki/collaborators.h"

namespace ukify {

inline constexpr char kDefaultSbsignBinary[] = "sbsign";

// Authenticode signs PE binaries with sbsign(1) from sbsigntools.
class SbsignPeSigner : public PeSigner {
 public:
  SbsignPeSigner(std::string sbsign_binary,
                 std::shared_ptr<CertificateSigner> signer);

  Result<void> Sign(const std::string& input_path,
                    const std::string& output_path) override;

 private:
  std::string sbsign_binary_;
  std::shared_ptr<CertificateSigner> signer_;
};

PeSignerFactory SbsignPeSignerFactory(
    const std::string& sbsign_binary = kDefaultSbsignBinary);

}  // namespace ukify
