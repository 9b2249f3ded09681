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

#include "host/libs/uki/sbat_reader.h"

#include <string>

#include "common/libs/utils/result.h"
#include "host/libs/pe/pe_image.h"

namespace ukify {

Result<std::string> PeSbatReader::ReadSbat(const std::string& stub_path) {
  auto image = UKIFY_EXPECT(PeImage::Open(stub_path));
  const auto* section = image.FindSection(kSbatSectionName);
  UKIFY_EXPECTF(section != nullptr, "Boot stub \"{}\" has no {} section",
                stub_path, kSbatSectionName);
  // The stub measures exactly VirtualSize bytes, a trailing NUL included.
  return UKIFY_EXPECT(image.ReadSectionData(*section));
}

}  // namespace ukify
