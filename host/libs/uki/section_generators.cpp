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

#include "host/libs/uki/section_generators.h"

#include <string>
#include <vector>

#include <json/json.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"
#include "host/libs/uki/os_release.h"

namespace ukify {
namespace {

constexpr char kPhasePath[] = "enter-initrd:leave-initrd:sysinit:ready";

Result<void> AppendSection(BuildContext& context, SectionName name,
                           const std::string& path, bool measure,
                           bool append) {
  UKIFY_EXPECT(context.sections.Append(Section{name, path, measure, append}));
  return {};
}

}  // namespace

Result<void> GenerateOsRelease(BuildContext& context) {
  std::string path;
  if (!context.config.os_release_path.empty()) {
    path = context.config.os_release_path;
    UKIFY_EXPECTF(FileExists(path), "os-release file \"{}\" does not exist",
                  path);
    BUILD_LOG(context.logger, DEBUG) << "Using existing os-release " << path;
  } else {
    BUILD_LOG(context.logger, DEBUG) << "Generating a new os-release";
    path = context.scratch.File("os-release");
    UKIFY_EXPECT(WriteNewFile(
        path, OsReleaseFor(context.config.os_name, context.config.version)));
  }
  return AppendSection(context, SectionName::kOsRelease, path, true, true);
}

Result<void> GenerateCmdline(BuildContext& context) {
  BUILD_LOG(context.logger, DEBUG)
      << "Using cmdline \"" << context.config.cmdline << "\"";
  auto path = context.scratch.File("cmdline");
  UKIFY_EXPECT(WriteNewFile(path, context.config.cmdline));
  return AppendSection(context, SectionName::kCmdLine, path, true, true);
}

Result<void> GenerateInitrd(BuildContext& context) {
  const auto& path = context.config.initrd_path;
  UKIFY_EXPECTF(FileExists(path), "initrd \"{}\" does not exist", path);
  BUILD_LOG(context.logger, DEBUG) << "Using initrd " << path;
  return AppendSection(context, SectionName::kInitrd, path, true, true);
}

Result<void> GenerateSplash(BuildContext& context) {
  std::string image;
  if (!context.config.splash_path.empty()) {
    BUILD_LOG(context.logger, DEBUG)
        << "Using splash " << context.config.splash_path;
    image = UKIFY_EXPECT(ReadFileContents(context.config.splash_path),
                         "Splash image is not readable");
  } else {
    BUILD_LOG(context.logger, DEBUG) << "Using the bundled splash";
    image = DefaultSplashImage();
  }
  auto path = context.scratch.File("splash.bmp");
  UKIFY_EXPECT(WriteNewFile(path, image));
  return AppendSection(context, SectionName::kSplash, path, true, true);
}

Result<void> GenerateUname(BuildContext& context) {
  const auto& kernel = context.config.kernel_path;
  auto version = context.collaborators.kernel_version_prober->DiscoverVersion(
      kernel);
  if (!version.ok()) {
    BUILD_LOG(context.logger, INFO)
        << "Could not infer the kernel version of " << kernel
        << ", skipping the uname section: " << version.error().Message();
    return {};
  }
  if (version->empty()) {
    BUILD_LOG(context.logger, INFO)
        << "Empty kernel version for " << kernel
        << ", skipping the uname section";
    return {};
  }
  BUILD_LOG(context.logger, DEBUG) << "Kernel version is " << *version;
  auto path = context.scratch.File("uname");
  UKIFY_EXPECT(WriteNewFile(path, *version));
  return AppendSection(context, SectionName::kUname, path, true, true);
}

Result<void> GenerateSbat(BuildContext& context) {
  const auto& stub = context.config.sd_stub_path;
  auto sbat = UKIFY_EXPECTF(context.collaborators.sbat_reader->ReadSbat(stub),
                            "Could not read SBAT data from \"{}\"", stub);
  BUILD_LOG(context.logger, DEBUG) << "SBAT of " << stub << ":\n" << sbat;
  auto path = context.scratch.File("sbat");
  UKIFY_EXPECT(WriteNewFile(path, sbat));
  // The stub already carries its .sbat section, it is only measured.
  return AppendSection(context, SectionName::kSbat, path, true, false);
}

Result<void> GeneratePcrPublicKey(BuildContext& context) {
  BUILD_LOG(context.logger, DEBUG) << "Exporting the PCR public key";
  auto pem = UKIFY_EXPECT(context.signers.pcr->PublicKeyPem());
  auto path = context.scratch.File("pcr-public.pem");
  UKIFY_EXPECT(WriteNewFile(path, pem));
  return AppendSection(context, SectionName::kPcrPublicKey, path, true, true);
}

Result<void> GenerateKernel(BuildContext& context) {
  const auto& path = context.config.kernel_path;
  UKIFY_EXPECTF(FileExists(path), "Kernel \"{}\" does not exist", path);
  BUILD_LOG(context.logger, DEBUG) << "Using kernel " << path;
  return AppendSection(context, SectionName::kKernel, path, true, true);
}

Result<void> GeneratePcrSignature(BuildContext& context) {
  BUILD_LOG(context.logger, INFO)
      << "Generating PCR measurements and signed policy";
  BUILD_LOG(context.logger, DEBUG) << "Using PCR " << kUkiPcr;
  auto measured = context.sections.Measured();
  auto& engine = *context.collaborators.measurement_engine;

  auto policy = UKIFY_EXPECT(engine.GenerateSignedMeasurement(
      measured, *context.signers.pcr, kUkiPcr));

  if (context.logger.ShouldLog(android::base::DEBUG)) {
    auto printed = engine.PrintMeasurements(kPhasePath, measured,
                                            context.logger);
    if (!printed.ok()) {
      BUILD_LOG(context.logger, WARNING)
          << "Could not print the expected measurements: "
          << printed.error().Message();
    }
  }

  Json::StreamWriterBuilder factory;
  factory["indentation"] = "";
  auto serialized = Json::writeString(factory, policy);
  context.failure_kind = BuildErrorKind::kIo;
  auto path = context.scratch.File("pcrsig.json");
  UKIFY_EXPECT(WriteNewFile(path, serialized));
  return AppendSection(context, SectionName::kPcrSig, path, false, true);
}

const std::vector<Stage>& SectionStages() {
  static const std::vector<Stage> kStages = {
      {"osrel", SectionName::kOsRelease, true, true, BuildErrorKind::kIo,
       GenerateOsRelease},
      {"cmdline", SectionName::kCmdLine, true, true, BuildErrorKind::kIo,
       GenerateCmdline},
      {"initrd", SectionName::kInitrd, true, true, BuildErrorKind::kIo,
       GenerateInitrd},
      {"splash", SectionName::kSplash, true, true, BuildErrorKind::kIo,
       GenerateSplash},
      {"uname", SectionName::kUname, true, true, BuildErrorKind::kIo,
       GenerateUname},
      {"sbat", SectionName::kSbat, true, false, BuildErrorKind::kIo,
       GenerateSbat},
      {"pcrpkey", SectionName::kPcrPublicKey, true, true, BuildErrorKind::kIo,
       GeneratePcrPublicKey},
      {"linux", SectionName::kKernel, true, true, BuildErrorKind::kIo,
       GenerateKernel},
      {"pcrsig", SectionName::kPcrSig, false, true,
       BuildErrorKind::kMeasurement, GeneratePcrSignature},
  };
  return kStages;
}

}  // namespace ukify
