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

#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/collaborators.h"
#include "host/libs/uki/section.h"

namespace ukify {

// Boot phases systemd-pcrphase extends into the UKI PCR, in boot order.
struct BootPhase {
  std::string name;
  // The policy for the PCR value after this phase is signed.
  bool sign;
};
const std::vector<BootPhase>& BootPhases();

std::string Sha256(const std::string& data);
Result<std::string> Sha256File(const std::string& path);
std::string HexString(const std::string& bytes);

// Replaces `pcr_value` with SHA-256(pcr_value || digest).
void ExtendPcr(std::string& pcr_value, const std::string& digest);

// PCR value after the stub measured `sections`, before any boot phase.
Result<std::string> MeasureSections(const MeasuredSections& sections);

// TPM2 PolicyPCR digest for a single SHA-256 PCR holding `pcr_value`.
Result<std::string> PolicyPcrDigest(const std::string& pcr_value, int pcr);

/**
 * Predicts the PCR values systemd-stub and systemd-pcrphase produce and
 * signs the policies of the phases in BootPhases() flagged for signing, the
 * same way systemd-measure does. The output is the JSON document the stub
 * expects in the ".pcrsig" section.
 */
class SystemdMeasurementEngine : public MeasurementEngine {
 public:
  Result<Json::Value> GenerateSignedMeasurement(
      const MeasuredSections& sections, const PcrSigner& signer,
      int pcr) override;
  Result<void> PrintMeasurements(const std::string& phase_path,
                                 const MeasuredSections& sections,
                                 const BuildLogger& logger) override;
};

}  // namespace ukify
