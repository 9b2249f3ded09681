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

#include "host/libs/pe/unittest/synthetic_pe.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ukify {
namespace {

constexpr uint32_t kNtHeadersOffset = 0x80;
constexpr uint32_t kFileAlignment = 0x200;

void Put(std::string& image, size_t offset, uint64_t value, size_t size) {
  if (image.size() < offset + size) {
    image.resize(offset + size, '\0');
  }
  for (size_t i = 0; i < size; i++) {
    image[offset + i] = static_cast<char>((value >> (8 * i)) & 0xff);
  }
}

uint32_t AlignUp(uint32_t value, uint32_t alignment) {
  return (value + alignment - 1) / alignment * alignment;
}

}  // namespace

std::string SyntheticPeImage(bool pe32_plus, uint64_t image_base,
                             uint32_t section_alignment,
                             const std::vector<SyntheticSection>& sections) {
  std::string image(kFileAlignment, '\0');
  image[0] = 'M';
  image[1] = 'Z';
  Put(image, 0x3C, kNtHeadersOffset, 4);

  image.replace(kNtHeadersOffset, 4, std::string("PE\0\0", 4));
  const uint32_t coff = kNtHeadersOffset + 4;
  const uint16_t optional_size = pe32_plus ? 240 : 224;
  Put(image, coff, 0x8664, 2);
  Put(image, coff + 2, sections.size(), 2);
  Put(image, coff + 16, optional_size, 2);

  const uint32_t optional = coff + 20;
  Put(image, optional, pe32_plus ? 0x20b : 0x10b, 2);
  if (pe32_plus) {
    Put(image, optional + 24, image_base, 8);
  } else {
    Put(image, optional + 28, image_base, 4);
  }
  Put(image, optional + 32, section_alignment, 4);
  Put(image, optional + 36, kFileAlignment, 4);

  uint32_t header = optional + optional_size;
  uint32_t raw = AlignUp(header + 40 * sections.size(), kFileAlignment);
  image.resize(raw, '\0');
  for (const auto& section : sections) {
    std::string name = section.name.substr(0, 8);
    name.resize(8, '\0');
    image.replace(header, 8, name);
    uint32_t raw_size = AlignUp(section.data.size(), kFileAlignment);
    Put(image, header + 8, section.data.size(), 4);
    Put(image, header + 12, section.virtual_address, 4);
    Put(image, header + 16, raw_size, 4);
    Put(image, header + 20, raw, 4);
    image.resize(raw + raw_size, '\0');
    image.replace(raw, section.data.size(), section.data);
    header += 40;
    raw += raw_size;
  }
  return image;
}

}  // namespace ukify
