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

#include "host/libs/uki/kernel_version.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include <android-base/macros.h>
#include <android-base/unique_fd.h>

#include "common/libs/utils/result.h"

namespace ukify {
namespace {

constexpr size_t kHeaderMagicOffset = 0x202;
constexpr char kHeaderMagic[] = "HdrS";
constexpr size_t kVersionPointerOffset = 0x20E;
// The version pointer is relative to the start of the real mode header.
constexpr size_t kVersionPointerBase = 0x200;
constexpr size_t kSetupSectsOffset = 0x1F1;
constexpr size_t kSectorSize = 512;
// Boot loaders assume 4 setup sectors when the field is 0.
constexpr size_t kDefaultSetupSects = 4;

Result<std::string> ReadPrefix(int fd, size_t size, const std::string& path) {
  std::string data(size, '\0');
  ssize_t bytes_read = TEMP_FAILURE_RETRY(pread(fd, data.data(), size, 0));
  UKIFY_EXPECTF(bytes_read >= 0, "Could not read \"{}\": {}", path,
                strerror(errno));
  data.resize(bytes_read);
  return data;
}

}  // namespace

size_t RealModeSize(const std::string& boot_sector) {
  size_t setup_sects = kDefaultSetupSects;
  if (boot_sector.size() > kSetupSectsOffset &&
      boot_sector[kSetupSectsOffset] != 0) {
    setup_sects = static_cast<uint8_t>(boot_sector[kSetupSectsOffset]);
  }
  return (setup_sects + 1) * kSectorSize;
}

Result<std::string> KernelVersionFromBzImage(const std::string& image) {
  UKIFY_EXPECT(image.size() >= kVersionPointerOffset + 2,
               "Image is too small to be a bzImage");
  UKIFY_EXPECT(image.compare(kHeaderMagicOffset, 4, kHeaderMagic) == 0,
               "No boot protocol header found");
  size_t pointer = static_cast<uint8_t>(image[kVersionPointerOffset]) |
                   static_cast<uint8_t>(image[kVersionPointerOffset + 1]) << 8;
  UKIFY_EXPECT(pointer != 0, "Image does not carry a version string");
  size_t start = pointer + kVersionPointerBase;
  UKIFY_EXPECTF(start < image.size(),
                "Version string offset {:#x} is beyond the header", start);
  auto end = image.find_first_of(std::string(" \0", 2), start);
  UKIFY_EXPECT(end != std::string::npos, "Version string is not terminated");
  UKIFY_EXPECT(end > start, "Version string is empty");
  return image.substr(start, end - start);
}

Result<std::string> BzImageKernelVersionProber::DiscoverVersion(
    const std::string& kernel_path) {
  android::base::unique_fd fd(open(kernel_path.c_str(), O_RDONLY | O_CLOEXEC));
  UKIFY_EXPECTF(fd.get() >= 0, "Could not open \"{}\": {}", kernel_path,
                strerror(errno));
  auto boot_sector =
      UKIFY_EXPECT(ReadPrefix(fd.get(), kSectorSize, kernel_path));
  auto header = UKIFY_EXPECT(
      ReadPrefix(fd.get(), RealModeSize(boot_sector), kernel_path));
  return UKIFY_EXPECTF(KernelVersionFromBzImage(header),
                       "Unable to find the kernel version of \"{}\"",
                       kernel_path);
}

}  // namespace ukify
