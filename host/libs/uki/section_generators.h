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
#include <string>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/uki/build_config.h"
#include "host/libs/uki/build_error.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/collaborators.h"
#include "host/libs/uki/scratch_dir.h"
#include "host/libs/uki/section.h"
#include "host/libs/uki/signer_resolution.h"

namespace ukify {

// Everything a section generator may use. Only `sections` and
// `failure_kind` are modified.
struct BuildContext {
  const BuildConfig& config;
  const ResolvedSigners& signers;
  const ScratchDir& scratch;
  SectionList& sections;
  const BuildLogger& logger;
  const Collaborators& collaborators;
  // Kind reported if the running stage fails. Starts as the stage's own
  // `failure_kind`, a generator narrows it for the step it is in.
  BuildErrorKind failure_kind;
};

Result<void> GenerateOsRelease(BuildContext& context);
Result<void> GenerateCmdline(BuildContext& context);
Result<void> GenerateInitrd(BuildContext& context);
Result<void> GenerateSplash(BuildContext& context);
// Adds nothing when the kernel version cannot be found.
Result<void> GenerateUname(BuildContext& context);
Result<void> GenerateSbat(BuildContext& context);
Result<void> GeneratePcrPublicKey(BuildContext& context);
Result<void> GenerateKernel(BuildContext& context);
Result<void> GeneratePcrSignature(BuildContext& context);

/**
 * One step of section generation.
 *
 * `produces`, `measure` and `append` describe the section the step adds,
 * which lets the ordering of the pipeline be checked without running it.
 */
struct Stage {
  std::string name;
  SectionName produces;
  bool measure;
  bool append;
  BuildErrorKind failure_kind;
  std::function<Result<void>(BuildContext&)> run;
};

// The section generation steps in the order they run.
const std::vector<Stage>& SectionStages();

}  // namespace ukify
