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

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/result.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/scratch_dir.h"
#include "host/libs/uki/section.h"

namespace ukify {

class CertificateSigner;
class PcrSigner;

// Produces an Authenticode signed copy of a PE binary.
class PeSigner {
 public:
  virtual ~PeSigner() = default;
  virtual Result<void> Sign(const std::string& input_path,
                            const std::string& output_path) = 0;
};

using PeSignerFactory = std::function<Result<std::unique_ptr<PeSigner>>(
    std::shared_ptr<CertificateSigner>)>;

// PCR the boot stub measures the UKI sections into.
inline constexpr int kUkiPcr = 11;

// Predicts the PCR values the boot stub will produce and signs the resulting
// policy.
class MeasurementEngine {
 public:
  virtual ~MeasurementEngine() = default;
  virtual Result<Json::Value> GenerateSignedMeasurement(
      const MeasuredSections& sections, const PcrSigner& signer, int pcr) = 0;
  // Debug output of the expected PCR values along `phase_path`, a colon
  // separated list of boot phases.
  virtual Result<void> PrintMeasurements(const std::string& phase_path,
                                         const MeasuredSections& sections,
                                         const BuildLogger& logger) = 0;
};

// Adds sections to a copy of the boot stub.
class Assembler {
 public:
  virtual ~Assembler() = default;
  // Returns the path of the unsigned image, created inside `work_dir`.
  virtual Result<std::string> Assemble(const std::string& stub_path,
                                       const std::vector<Section>& sections,
                                       const std::string& work_dir) = 0;
};

class KernelVersionProber {
 public:
  virtual ~KernelVersionProber() = default;
  virtual Result<std::string> DiscoverVersion(
      const std::string& kernel_path) = 0;
};

// Reads the SBAT metadata embedded in a boot stub.
class SbatReader {
 public:
  virtual ~SbatReader() = default;
  virtual Result<std::string> ReadSbat(const std::string& stub_path) = 0;
};

struct Collaborators {
  PeSignerFactory pe_signer_factory;
  std::shared_ptr<MeasurementEngine> measurement_engine;
  std::shared_ptr<Assembler> assembler;
  std::shared_ptr<KernelVersionProber> kernel_version_prober;
  std::shared_ptr<SbatReader> sbat_reader;
  DirectoryRemover scratch_remover = RecursivelyRemoveDirectory;
};

}  // namespace ukify
