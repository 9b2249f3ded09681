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

#include "host/libs/pe/pe_image.h"

#include <cstdint>
#include <string>
#include <utility>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"

namespace ukify {
namespace {

constexpr size_t kDosLfanewOffset = 0x3C;
constexpr uint16_t kDosMagic = 0x5A4D;  // "MZ"
constexpr uint32_t kNtSignature = 0x00004550;  // "PE\0\0"
constexpr size_t kCoffHeaderSize = 20;
constexpr uint16_t kPe32Magic = 0x10b;
constexpr uint16_t kPe32PlusMagic = 0x20b;
constexpr size_t kSectionHeaderSize = 40;
constexpr size_t kSectionNameSize = 8;

template <typename T>
Result<T> ReadLittleEndian(const std::string& data, size_t offset) {
  UKIFY_EXPECTF(offset <= data.size() && data.size() - offset >= sizeof(T),
                "Read of {} bytes at offset {} is beyond the end of the "
                "image ({} bytes)",
                sizeof(T), offset, data.size());
  T value = 0;
  for (size_t i = 0; i < sizeof(T); i++) {
    value |= static_cast<T>(static_cast<uint8_t>(data[offset + i])) << (8 * i);
  }
  return value;
}

}  // namespace

Result<PeImage> PeImage::Open(const std::string& path) {
  auto contents = UKIFY_EXPECT(ReadFileContents(path));
  return UKIFY_EXPECTF(Parse(std::move(contents)),
                       "\"{}\" is not a valid PE image", path);
}

Result<PeImage> PeImage::Parse(std::string data) {
  PeImage image;
  image.data_ = std::move(data);
  const auto& bytes = image.data_;

  auto dos_magic = UKIFY_EXPECT(ReadLittleEndian<uint16_t>(bytes, 0));
  UKIFY_EXPECT_EQ(dos_magic, kDosMagic, "Missing MZ signature");
  uint32_t nt_offset =
      UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, kDosLfanewOffset));
  auto signature = UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, nt_offset));
  UKIFY_EXPECT_EQ(signature, kNtSignature, "Missing PE signature");

  const size_t coff = nt_offset + 4;
  uint16_t number_of_sections =
      UKIFY_EXPECT(ReadLittleEndian<uint16_t>(bytes, coff + 2));
  uint16_t optional_header_size =
      UKIFY_EXPECT(ReadLittleEndian<uint16_t>(bytes, coff + 16));

  const size_t optional = coff + kCoffHeaderSize;
  auto magic = UKIFY_EXPECT(ReadLittleEndian<uint16_t>(bytes, optional));
  if (magic == kPe32PlusMagic) {
    image.is_64_bit_ = true;
    image.image_base_ =
        UKIFY_EXPECT(ReadLittleEndian<uint64_t>(bytes, optional + 24));
  } else if (magic == kPe32Magic) {
    image.image_base_ =
        UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, optional + 28));
  } else {
    return UKIFY_ERRF("Unknown optional header magic {:#x}", magic);
  }
  image.section_alignment_ =
      UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, optional + 32));
  UKIFY_EXPECT(image.section_alignment_ != 0, "Section alignment is zero");

  size_t offset = optional + optional_header_size;
  for (uint16_t i = 0; i < number_of_sections; i++) {
    UKIFY_EXPECTF(bytes.size() >= offset + kSectionHeaderSize,
                  "Section header {} is truncated", i);
    PeSectionHeader section;
    section.name = bytes.substr(offset, kSectionNameSize);
    section.name.resize(section.name.find('\0') == std::string::npos
                            ? section.name.size()
                            : section.name.find('\0'));
    section.virtual_size =
        UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, offset + 8));
    section.virtual_address =
        UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, offset + 12));
    section.size_of_raw_data =
        UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, offset + 16));
    section.pointer_to_raw_data =
        UKIFY_EXPECT(ReadLittleEndian<uint32_t>(bytes, offset + 20));
    image.sections_.emplace_back(std::move(section));
    offset += kSectionHeaderSize;
  }
  return image;
}

const PeSectionHeader* PeImage::FindSection(const std::string& name) const {
  for (const auto& section : sections_) {
    if (section.name == name) {
      return &section;
    }
  }
  return nullptr;
}

Result<std::string> PeImage::ReadSectionData(
    const PeSectionHeader& section) const {
  size_t size = section.size_of_raw_data;
  if (section.virtual_size != 0 && section.virtual_size < size) {
    size = section.virtual_size;
  }
  UKIFY_EXPECTF(section.pointer_to_raw_data <= data_.size() &&
                    data_.size() - section.pointer_to_raw_data >= size,
                "Section {} extends beyond the end of the image", section.name);
  return data_.substr(section.pointer_to_raw_data, size);
}

}  // namespace ukify
