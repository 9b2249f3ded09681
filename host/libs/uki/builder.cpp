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

#include "host/libs/uki/builder.h"

#include <cerrno>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <android-base/expected.h>
#include <android-base/scopeguard.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "host/libs/uki/section_generators.h"
#include "host/libs/uki/signer_resolution.h"

namespace ukify {
namespace {

BuildResult Fail(BuildErrorKind kind, const std::string& stage,
                 StackTraceError error) {
  return android::base::unexpected(BuildError{kind, stage, std::move(error)});
}

}  // namespace

Builder::Builder(BuildConfig config, BuildLogger logger,
                 Collaborators collaborators)
    : Builder(std::move(config), std::move(logger), std::move(collaborators),
              SectionStages()) {}

Builder::Builder(BuildConfig config, BuildLogger logger,
                 Collaborators collaborators, std::vector<Stage> stages)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      collaborators_(std::move(collaborators)),
      stages_(std::move(stages)) {}

Result<void> Builder::ValidateCollaborators() const {
  UKIFY_EXPECT(collaborators_.pe_signer_factory != nullptr,
               "No PE signer factory");
  UKIFY_EXPECT(collaborators_.measurement_engine != nullptr,
               "No measurement engine");
  UKIFY_EXPECT(collaborators_.assembler != nullptr, "No assembler");
  UKIFY_EXPECT(collaborators_.kernel_version_prober != nullptr,
               "No kernel version prober");
  UKIFY_EXPECT(collaborators_.sbat_reader != nullptr, "No SBAT reader");
  UKIFY_EXPECT(collaborators_.scratch_remover != nullptr,
               "No scratch directory remover");
  return {};
}

Result<std::unique_ptr<PeSigner>> Builder::CreatePeSigner(
    const ResolvedSigners& signers) const {
  auto signer = UKIFY_EXPECT(collaborators_.pe_signer_factory(
      signers.secure_boot));
  UKIFY_EXPECT(signer != nullptr, "The PE signer factory returned nothing");
  return signer;
}

BuildResult Builder::Build() {
  sections_ = SectionList();
  last_scratch_dir_.clear();

  auto collaborators_ok = ValidateCollaborators();
  if (!collaborators_ok.ok()) {
    return Fail(BuildErrorKind::kConfiguration, "config",
                collaborators_ok.error());
  }
  auto config_ok = ValidateBuildConfig(config_);
  if (!config_ok.ok()) {
    return Fail(BuildErrorKind::kConfiguration, "config", config_ok.error());
  }
  auto signers = ResolveSigners(config_);
  if (!signers.ok()) {
    return Fail(BuildErrorKind::kConfiguration, "signers", signers.error());
  }

  // Only the final signing step may leave a file at the output path.
  if (FileExists(config_.out_uki_path, false) &&
      !RemoveFile(config_.out_uki_path)) {
    return Fail(BuildErrorKind::kIo, "output",
                UKIFY_ERRF("Could not remove the previous output \"{}\": {}",
                           config_.out_uki_path, strerror(errno)));
  }

  auto scratch = ScratchDir::Create(config_.scratch_parent_dir,
                                    collaborators_.scratch_remover);
  if (!scratch.ok()) {
    return Fail(BuildErrorKind::kIo, "scratch", scratch.error());
  }
  last_scratch_dir_ = scratch->Path();
  BUILD_LOG(logger_, DEBUG) << "Using scratch directory " << last_scratch_dir_;

  // Runs after the result below is computed, and never changes it.
  auto remove_scratch = android::base::make_scope_guard([this, &scratch]() {
    auto removed = scratch->Remove();
    if (!removed.ok()) {
      BUILD_LOG(logger_, ERROR) << "Failed to clean up: "
                                << removed.error().Message();
    }
  });

  return RunPipeline(*signers, *scratch);
}

BuildResult Builder::RunPipeline(const ResolvedSigners& signers,
                                 const ScratchDir& scratch) {
  std::unique_ptr<PeSigner> pe_signer;
  if (!config_.sd_boot_path.empty()) {
    BUILD_LOG(logger_, INFO) << "Signing " << config_.sd_boot_path;
    auto created = CreatePeSigner(signers);
    if (!created.ok()) {
      return Fail(BuildErrorKind::kSigning, "sd-boot", created.error());
    }
    pe_signer = std::move(*created);
    auto signed_boot =
        pe_signer->Sign(config_.sd_boot_path, config_.out_sd_boot_path);
    if (!signed_boot.ok()) {
      return Fail(BuildErrorKind::kSigning, "sd-boot", signed_boot.error());
    }
  } else {
    BUILD_LOG(logger_, INFO) << "No boot loader given, not signing one";
  }

  BuildContext context{config_,   signers, scratch,
                       sections_, logger_, collaborators_,
                       BuildErrorKind::kIo};
  for (const auto& stage : stages_) {
    BUILD_LOG(logger_, DEBUG) << "Running stage " << stage.name;
    context.failure_kind = stage.failure_kind;
    auto generated = stage.run(context);
    if (!generated.ok()) {
      return Fail(context.failure_kind, stage.name, generated.error());
    }
  }

  auto complete = sections_.ValidateFinal();
  if (!complete.ok()) {
    return Fail(BuildErrorKind::kAssembly, "assemble", complete.error());
  }
  BUILD_LOG(logger_, INFO) << "Assembling the UKI";
  auto unsigned_uki = collaborators_.assembler->Assemble(
      config_.sd_stub_path, sections_.Appended(), scratch.Path());
  if (!unsigned_uki.ok()) {
    return Fail(BuildErrorKind::kAssembly, "assemble", unsigned_uki.error());
  }

  if (!pe_signer) {
    auto created = CreatePeSigner(signers);
    if (!created.ok()) {
      return Fail(BuildErrorKind::kSigning, "sign", created.error());
    }
    pe_signer = std::move(*created);
  }
  BUILD_LOG(logger_, INFO) << "Signing the UKI into " << config_.out_uki_path;
  auto signed_uki = pe_signer->Sign(*unsigned_uki, config_.out_uki_path);
  if (!signed_uki.ok()) {
    return Fail(BuildErrorKind::kSigning, "sign", signed_uki.error());
  }
  return {};
}

}  // namespace ukify
