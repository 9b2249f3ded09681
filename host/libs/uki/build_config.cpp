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

#include "host/libs/uki/build_config.h"

#include "common/libs/utils/result.h"

namespace ukify {

Result<void> ValidateBuildConfig(const BuildConfig& config) {
  UKIFY_EXPECT(!config.sd_stub_path.empty(), "No boot stub given");
  UKIFY_EXPECT(!config.kernel_path.empty(), "No kernel image given");
  UKIFY_EXPECT(!config.initrd_path.empty(), "No initrd given");
  UKIFY_EXPECT(!config.out_uki_path.empty(), "No output path for the UKI");
  if (!config.sd_boot_path.empty()) {
    UKIFY_EXPECTF(!config.out_sd_boot_path.empty(),
                  "No output path for the signed boot loader \"{}\"",
                  config.sd_boot_path);
  }
  return {};
}

}  // namespace ukify
