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

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include "common/libs/utils/result.h"

namespace ukify {

enum class SectionName {
  kOsRelease,
  kCmdLine,
  kInitrd,
  kSplash,
  kUname,
  kSbat,
  kPcrPublicKey,
  kKernel,
  kPcrSig,
};

// The PE section name, e.g. ".linux".
std::string SectionNameToString(SectionName name);
std::ostream& operator<<(std::ostream& out, SectionName name);

struct Section {
  SectionName name;
  // Location of the backing content. Either a file in the scratch directory
  // or an externally supplied artifact.
  std::string path;
  // Part of the PCR measurement set.
  bool measure;
  // Added to the assembled binary.
  bool append;
};

// Section name to backing path, for every measured section.
using MeasuredSections = std::map<SectionName, std::string>;

/**
 * The ordered, append-only list of sections of one build.
 *
 * Append rejects any section that would break the layout the boot stub and
 * the measurement policy rely on. A section is never changed once appended.
 */
class SectionList {
 public:
  Result<void> Append(Section section);

  const std::vector<Section>& Sections() const { return sections_; }
  bool Contains(SectionName name) const;
  const Section* Find(SectionName name) const;

  MeasuredSections Measured() const;
  // Sections to be added to the binary, in list order.
  std::vector<Section> Appended() const;

  // Checks a finished list: the kernel is present and immediately followed
  // by the measurement signature, which closes the list.
  Result<void> ValidateFinal() const;

 private:
  std::vector<Section> sections_;
};

}  // namespace ukify
