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

#include "common/libs/utils/result.h"

namespace ukify {

struct PeSectionHeader {
  std::string name;
  uint32_t virtual_size;
  uint32_t virtual_address;
  uint32_t size_of_raw_data;
  uint32_t pointer_to_raw_data;
};

/**
 * Read-only view of the headers and section table of a PE/COFF image.
 *
 * Only what is needed to place new sections after the existing ones and to
 * read existing section contents is decoded. Both PE32 and PE32+ images are
 * accepted.
 */
class PeImage {
 public:
  static Result<PeImage> Open(const std::string& path);
  static Result<PeImage> Parse(std::string data);

  bool Is64Bit() const { return is_64_bit_; }
  uint64_t ImageBase() const { return image_base_; }
  uint32_t SectionAlignment() const { return section_alignment_; }
  const std::vector<PeSectionHeader>& Sections() const { return sections_; }
  const PeSectionHeader* FindSection(const std::string& name) const;

  // Raw data of the section, truncated to its virtual size.
  Result<std::string> ReadSectionData(const PeSectionHeader& section) const;

 private:
  PeImage() = default;

  std::string data_;
  bool is_64_bit_ = false;
  uint64_t image_base_ = 0;
  uint32_t section_alignment_ = 0;
  std::vector<PeSectionHeader> sections_;
};

}  // namespace ukify
