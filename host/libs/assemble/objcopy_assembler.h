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
#include <utility>
#include <vector>

#include "common/libs/utils/result.h"
#include "host/libs/pe/pe_image.h"
#include "host/libs/uki/collaborators.h"
#include "host/libs/uki/section.h"

namespace ukify {

inline constexpr char kDefaultObjcopyBinary[] = "objcopy";
inline constexpr char kUnsignedImageName[] = "uki.unsigned.efi";

// Where a section is placed in the assembled image.
struct SectionPlacement {
  Section section;
  uint64_t vma;
};

// Places `sections` one after the other behind the last section of `stub`,
// each aligned to the stub's section alignment.
Result<std::vector<SectionPlacement>> PlaceSections(
    const PeImage& stub, const std::vector<Section>& sections);

// Appends sections to a boot stub with objcopy(1).
class ObjcopyAssembler : public Assembler {
 public:
  explicit ObjcopyAssembler(std::string objcopy_binary = kDefaultObjcopyBinary)
      : objcopy_binary_(std::move(objcopy_binary)) {}

  Result<std::string> Assemble(const std::string& stub_path,
                               const std::vector<Section>& sections,
                               const std::string& work_dir) override;

 private:
  std::string objcopy_binary_;
};

}  // namespace ukify
