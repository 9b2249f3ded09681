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

#include <string>
#include <utility>

#include <android-base/logging.h>
#include <gflags/gflags.h>

#include "common/libs/utils/result.h"
#include "host/libs/assemble/objcopy_assembler.h"
#include "host/libs/signing/sbsign_pe_signer.h"
#include "host/libs/uki/build_config.h"
#include "host/libs/uki/build_logger.h"
#include "host/libs/uki/builder.h"
#include "host/libs/uki/default_collaborators.h"

DEFINE_string(sd_stub, "", "Path to the systemd boot stub, e.g. "
              "linuxx64.efi.stub");
DEFINE_string(sd_boot, "", "Optional boot loader to sign, e.g. "
              "systemd-bootx64.efi");
DEFINE_string(out_sd_boot, "", "Where to write the signed boot loader");
DEFINE_string(kernel, "", "Kernel image");
DEFINE_string(initrd, "", "Initrd image");
DEFINE_string(cmdline, "", "Kernel command line");
DEFINE_string(os_release, "", "os-release file. A minimal one is generated "
              "when empty");
DEFINE_string(os_name, ukify::kDefaultOsName,
              "Name in the generated os-release");
DEFINE_string(os_version, "", "Version in the generated os-release");
DEFINE_string(splash, "", "BMP splash image. A bundled one is used when "
              "empty");
DEFINE_string(pcr_key, "", "PEM RSA private key signing the PCR policy");
DEFINE_string(sb_cert, "", "PEM certificate for Secure Boot signing");
DEFINE_string(sb_key, "", "PEM private key for Secure Boot signing");
DEFINE_string(output, "", "Where to write the signed UKI");
DEFINE_string(scratch_dir, "", "Directory to create the scratch directory "
              "in. Defaults to $TMPDIR or /tmp");
DEFINE_string(log_level, "info", "One of debug, info, warn or error");
DEFINE_string(sbsign_binary, ukify::kDefaultSbsignBinary,
              "sbsign executable");
DEFINE_string(objcopy_binary, ukify::kDefaultObjcopyBinary,
              "objcopy executable");

namespace ukify {
namespace {

constexpr char kUsageMessage[] =
    "--sd_stub=<stub> --kernel=<kernel> --initrd=<initrd> "
    "--pcr_key=<key> --sb_cert=<cert> --sb_key=<key> --output=<uki> "
    "[flags]\n"
    "\n"
    "Builds a signed Unified Kernel Image with a signed PCR 11 policy.";

BuildConfig BuildConfigFromFlags() {
  BuildConfig config;
  config.sd_stub_path = FLAGS_sd_stub;
  config.sd_boot_path = FLAGS_sd_boot;
  config.out_sd_boot_path = FLAGS_out_sd_boot;
  config.kernel_path = FLAGS_kernel;
  config.initrd_path = FLAGS_initrd;
  config.cmdline = FLAGS_cmdline;
  config.os_release_path = FLAGS_os_release;
  config.os_name = FLAGS_os_name;
  config.version = FLAGS_os_version;
  config.splash_path = FLAGS_splash;
  config.pcr_key_path = FLAGS_pcr_key;
  config.sb_cert_path = FLAGS_sb_cert;
  config.sb_key_path = FLAGS_sb_key;
  config.out_uki_path = FLAGS_output;
  config.scratch_parent_dir = FLAGS_scratch_dir;
  return config;
}

}  // namespace

Result<int> UkifyMain(int argc, char** argv) {
  ::android::base::InitLogging(argv, android::base::StderrLogger);
  gflags::SetUsageMessage(kUsageMessage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  auto severity = ParseLogSeverity(FLAGS_log_level);
  android::base::SetMinimumLogSeverity(severity);

  Builder builder(BuildConfigFromFlags(), BuildLogger(severity),
                  DefaultCollaborators(FLAGS_sbsign_binary,
                                       FLAGS_objcopy_binary));
  auto built = builder.Build();
  if (!built.ok()) {
    auto error = built.error().error;
    return std::move(error).PushEntry(
        UKIFY_ERRF("Build failed in stage {} ({} error)", built.error().stage,
                   BuildErrorKindToString(built.error().kind)));
  }
  LOG(INFO) << "Wrote " << FLAGS_output;
  return 0;
}

}  // namespace ukify

int main(int argc, char** argv) {
  auto res = ukify::UkifyMain(argc, argv);
  if (res.ok()) {
    return *res;
  }
  LOG(ERROR) << "ukify failed: \n" << res.error().Message();
  LOG(DEBUG) << "ukify failed: \n" << res.error().Trace();
  return 1;
}
