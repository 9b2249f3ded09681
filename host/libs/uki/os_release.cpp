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

#include "host/libs/uki/os_release.h"

#include <cctype>
#include <string>

#include <fmt/core.h>

namespace ukify {
namespace {

std::string OsReleaseId(const std::string& name) {
  std::string id;
  for (char c : name) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      id += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (c == '-' || c == '.' || c == '_') {
      id += c;
    } else if (!id.empty() && id.back() != '-') {
      id += '-';
    }
  }
  return id;
}

// 1x1 pixel, 24 bits per pixel, black.
constexpr unsigned char kDefaultSplash[] = {
    // BITMAPFILEHEADER
    'B', 'M', 0x3a, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x36, 0x00,
    0x00, 0x00,
    // BITMAPINFOHEADER
    0x28, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
    0x01, 0x00, 0x18, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00, 0x00, 0x00,
    0x13, 0x0b, 0x00, 0x00, 0x13, 0x0b, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0x00, 0x00,
    // Pixel row, padded to 4 bytes
    0x00, 0x00, 0x00, 0x00,
};

}  // namespace

std::string OsReleaseFor(const std::string& name, const std::string& version) {
  return fmt::format(
      "NAME=\"{0}\"\n"
      "ID={1}\n"
      "VERSION_ID={2}\n"
      "PRETTY_NAME=\"{0} ({2})\"\n",
      name, OsReleaseId(name), version);
}

const std::string& DefaultSplashImage() {
  static const std::string kImage(reinterpret_cast<const char*>(kDefaultSplash),
                                  sizeof(kDefaultSplash));
  return kImage;
}

}  // namespace ukify
