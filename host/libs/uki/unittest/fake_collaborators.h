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

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/measure/systemd_measurement.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/collaborators.h"
#include "host/libs/uki/section.h"

namespace ukify {

// Copies instead of signing and remembers what it was asked to sign.
struct FakePeSignerState {
  std::vector<std::pair<std::string, std::string>> calls;
  // Fails the call with this index, counting from 0.
  std::optional<size_t> fail_call;
  size_t signers_created = 0;
};

class FakePeSigner : public PeSigner {
 public:
  explicit FakePeSigner(std::shared_ptr<FakePeSignerState> state)
      : state_(std::move(state)) {}

  Result<void> Sign(const std::string& input_path,
                    const std::string& output_path) override;

 private:
  std::shared_ptr<FakePeSignerState> state_;
};

PeSignerFactory FakePeSignerFactory(std::shared_ptr<FakePeSignerState> state);

// Forwards to the real engine and records the section maps it receives.
class RecordingMeasurementEngine : public MeasurementEngine {
 public:
  Result<Json::Value> GenerateSignedMeasurement(
      const MeasuredSections& sections, const PcrSigner& signer,
      int pcr) override;
  Result<void> PrintMeasurements(const std::string& phase_path,
                                 const MeasuredSections& sections,
                                 const BuildLogger& logger) override;

  std::vector<MeasuredSections> measured;
  std::vector<int> pcrs;
  size_t print_calls = 0;
  bool fail = false;

 private:
  SystemdMeasurementEngine engine_;
};

// Keeps a copy of every section it receives and concatenates them.
class SnapshotAssembler : public Assembler {
 public:
  Result<std::string> Assemble(const std::string& stub_path,
                               const std::vector<Section>& sections,
                               const std::string& work_dir) override;

  std::vector<SectionName> order;
  std::map<SectionName, std::string> contents;
  std::string work_dir;
  bool fail = false;
};

class FakeKernelVersionProber : public KernelVersionProber {
 public:
  explicit FakeKernelVersionProber(Result<std::string> version)
      : version_(std::move(version)) {}

  Result<std::string> DiscoverVersion(const std::string&) override {
    return version_;
  }

 private:
  Result<std::string> version_;
};

class FakeSbatReader : public SbatReader {
 public:
  Result<std::string> ReadSbat(const std::string&) override { return sbat; }

  std::string sbat =
      "sbat,1,SBAT Version,sbat,1,https://github.com/rhboot/shim/blob/main/"
      "SBAT.md\n";
};

}  // namespace ukify
