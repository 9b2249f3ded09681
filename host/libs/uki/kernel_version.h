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

#include <cstddef>
#include <string>

#include "common/libs/utils/result.h"
#include "host/libs/uki/collaborators.h"

namespace ukify {

/**
 * Recovers the kernel release from an x86 bzImage.
 *
 * The boot protocol header carries a pointer to the version banner built
 * into the image (e.g. "6.6.1 (builder@host) #1 SMP ..."); the first word of
 * it is the release uname(2) reports. Images without that header, such as
 * arm64 Image files, fail.
 */
class BzImageKernelVersionProber : public KernelVersionProber {
 public:
  Result<std::string> DiscoverVersion(const std::string& kernel_path) override;
};

// Same as above on the already loaded image header.
Result<std::string> KernelVersionFromBzImage(const std::string& image);

// Size of the boot sector plus the setup sectors it announces at 0x1F1.
size_t RealModeSize(const std::string& boot_sector);

}  // namespace ukify
