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

#include "host/libs/uki/section.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "common/libs/utils/result.h"

namespace ukify {

std::string SectionNameToString(SectionName name) {
  switch (name) {
    case SectionName::kOsRelease:
      return ".osrel";
    case SectionName::kCmdLine:
      return ".cmdline";
    case SectionName::kInitrd:
      return ".initrd";
    case SectionName::kSplash:
      return ".splash";
    case SectionName::kUname:
      return ".uname";
    case SectionName::kSbat:
      return ".sbat";
    case SectionName::kPcrPublicKey:
      return ".pcrpkey";
    case SectionName::kKernel:
      return ".linux";
    case SectionName::kPcrSig:
      return ".pcrsig";
  }
  return "<unknown>";
}

std::ostream& operator<<(std::ostream& out, SectionName name) {
  return out << SectionNameToString(name);
}

Result<void> SectionList::Append(Section section) {
  const auto name = SectionNameToString(section.name);
  UKIFY_EXPECTF(!Contains(section.name), "Section {} was already added", name);
  UKIFY_EXPECTF(!section.path.empty(), "Section {} has no backing path", name);
  if (section.name == SectionName::kPcrSig) {
    UKIFY_EXPECT(!section.measure,
                 "The measurement signature cannot be part of the measurement");
    UKIFY_EXPECT(Contains(SectionName::kKernel),
                 "The measurement signature must follow the kernel");
  }
  if (section.name == SectionName::kSbat) {
    UKIFY_EXPECT(!section.append,
                 "SBAT data is already part of the boot stub, it can only be "
                 "measured");
  }
  if (section.measure) {
    UKIFY_EXPECTF(!Contains(SectionName::kKernel),
                  "Measured section {} cannot follow the kernel", name);
  }
  sections_.emplace_back(std::move(section));
  return {};
}

bool SectionList::Contains(SectionName name) const {
  return Find(name) != nullptr;
}

const Section* SectionList::Find(SectionName name) const {
  for (const auto& section : sections_) {
    if (section.name == name) {
      return &section;
    }
  }
  return nullptr;
}

MeasuredSections SectionList::Measured() const {
  MeasuredSections measured;
  for (const auto& section : sections_) {
    if (section.measure) {
      measured.emplace(section.name, section.path);
    }
  }
  return measured;
}

std::vector<Section> SectionList::Appended() const {
  std::vector<Section> appended;
  for (const auto& section : sections_) {
    if (section.append) {
      appended.push_back(section);
    }
  }
  return appended;
}

Result<void> SectionList::ValidateFinal() const {
  UKIFY_EXPECT(sections_.size() >= 2, "Section list is incomplete");
  const auto& last = sections_[sections_.size() - 1];
  const auto& before_last = sections_[sections_.size() - 2];
  UKIFY_EXPECTF(last.name == SectionName::kPcrSig,
                "The last section is {} instead of the measurement signature",
                SectionNameToString(last.name));
  UKIFY_EXPECTF(before_last.name == SectionName::kKernel,
                "The measurement signature follows {} instead of the kernel",
                SectionNameToString(before_last.name));
  return {};
}

}  // namespace ukify
