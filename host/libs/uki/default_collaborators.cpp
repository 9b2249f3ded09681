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

#include "host/libs/uki/default_collaborators.h"

#include <memory>
#include <string>

#include "host/libs/assemble/objcopy_assembler.h"
#include "host/libs/measure/systemd_measurement.h"
#include "host/libs/signing/sbsign_pe_signer.h"
#include "host/libs/uki/kernel_version.h"
#include "host/libs/uki/sbat_reader.h"

namespace ukify {

Collaborators DefaultCollaborators(const std::string& sbsign_binary,
                                   const std::string& objcopy_binary) {
  Collaborators collaborators;
  collaborators.pe_signer_factory = SbsignPeSignerFactory(sbsign_binary);
  collaborators.measurement_engine =
      std::make_shared<SystemdMeasurementEngine>();
  collaborators.assembler = std::make_shared<ObjcopyAssembler>(objcopy_binary);
  collaborators.kernel_version_prober =
      std::make_shared<BzImageKernelVersionProber>();
  collaborators.sbat_reader = std::make_shared<PeSbatReader>();
  return collaborators;
}

}  // namespace ukify
