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
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/uki/build_config.h"
#include "host/libs/uki/build_error.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/collaborators.h"
#include "host/libs/uki/scratch_dir.h"
#include "host/libs/uki/section.h"
#include "host/libs/uki/section_generators.h"
#include "host/libs/uki/signer_resolution.h"

namespace ukify {

/**
 * Builds one signed Unified Kernel Image.
 *
 * Build() resolves the signers, creates a scratch directory, optionally signs
 * the boot loader, runs the section stages in order, assembles the appended
 * sections onto the boot stub and signs the result into
 * `BuildConfig::out_uki_path`. The scratch directory is removed on every
 * return path. Nothing is written to the output path unless every earlier
 * step succeeded.
 */
class Builder {
 public:
  Builder(BuildConfig config, BuildLogger logger, Collaborators collaborators);
  // Runs `stages` instead of SectionStages().
  Builder(BuildConfig config, BuildLogger logger, Collaborators collaborators,
          std::vector<Stage> stages);

  BuildResult Build();

  // Sections of the last build, also when it failed part way.
  const SectionList& Sections() const { return sections_; }
  // Scratch directory used by the last build. Empty if none was created.
  const std::string& LastScratchDir() const { return last_scratch_dir_; }

 private:
  BuildResult RunPipeline(const ResolvedSigners& signers,
                          const ScratchDir& scratch);
  Result<void> ValidateCollaborators() const;
  Result<std::unique_ptr<PeSigner>> CreatePeSigner(
      const ResolvedSigners& signers) const;

  const BuildConfig config_;
  const BuildLogger logger_;
  const Collaborators collaborators_;
  const std::vector<Stage> stages_;

  SectionList sections_;
  std::string last_scratch_dir_;
};

}  // namespace ukify
