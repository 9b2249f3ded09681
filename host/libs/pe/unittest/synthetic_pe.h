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

#include <cstdint>
#include <string>
#include <vector>

namespace ukify {

struct SyntheticSection {
  std::string name;
  uint32_t virtual_address;
  // Raw data is padded to the file alignment, the virtual size is the
  // unpadded size.
  std::string data;
};

// Minimal PE image with the given sections, only meant for header parsing.
std::string SyntheticPeImage(bool pe32_plus, uint64_t image_base,
                             uint32_t section_alignment,
                             const std::vector<SyntheticSection>& sections);

}  // namespace ukify
