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

#include "host/libs/uki/unittest/fake_collaborators.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"

namespace ukify {

Result<void> FakePeSigner::Sign(const std::string& input_path,
                                const std::string& output_path) {
  size_t index = state_->calls.size();
  state_->calls.emplace_back(input_path, output_path);
  if (state_->fail_call && *state_->fail_call == index) {
    return UKIFY_ERRF("Signing \"{}\" failed", input_path);
  }
  auto contents = UKIFY_EXPECT(ReadFileContents(input_path));
  UKIFY_EXPECT(WriteNewFile(output_path, "signed:" + contents));
  return {};
}

PeSignerFactory FakePeSignerFactory(std::shared_ptr<FakePeSignerState> state) {
  return [state](std::shared_ptr<CertificateSigner> signer)
             -> Result<std::unique_ptr<PeSigner>> {
    UKIFY_EXPECT(signer != nullptr, "No Secure Boot signer");
    state->signers_created++;
    return std::unique_ptr<PeSigner>(new FakePeSigner(state));
  };
}

Result<Json::Value> RecordingMeasurementEngine::GenerateSignedMeasurement(
    const MeasuredSections& sections, const PcrSigner& signer, int pcr) {
  measured.push_back(sections);
  pcrs.push_back(pcr);
  UKIFY_EXPECT(!fail, "Measurement failure requested");
  return UKIFY_EXPECT(engine_.GenerateSignedMeasurement(sections, signer, pcr));
}

Result<void> RecordingMeasurementEngine::PrintMeasurements(
    const std::string& phase_path, const MeasuredSections& sections,
    const BuildLogger& logger) {
  print_calls++;
  UKIFY_EXPECT(engine_.PrintMeasurements(phase_path, sections, logger));
  return {};
}

Result<std::string> SnapshotAssembler::Assemble(
    const std::string& stub_path, const std::vector<Section>& sections,
    const std::string& dir) {
  work_dir = dir;
  UKIFY_EXPECT(!fail, "Assembly failure requested");
  std::string image = UKIFY_EXPECT(ReadFileContents(stub_path));
  for (const auto& section : sections) {
    order.push_back(section.name);
    auto data = UKIFY_EXPECT(ReadFileContents(section.path));
    contents[section.name] = data;
    image += data;
  }
  auto output = dir + "/unsigned.efi";
  UKIFY_EXPECT(WriteNewFile(output, image));
  return output;
}

}  // namespace ukify
