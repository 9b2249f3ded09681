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

#include "host/libs/assemble/objcopy_assembler.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "common/libs/utils/files.h"
#include "common/libs/utils/result.h"
#include "common/libs/utils/subprocess.h"
#include "host/libs/pe/pe_image.h"

namespace ukify {
namespace {

uint64_t AlignUp(uint64_t value, uint64_t alignment) {
  return (value + alignment - 1) / alignment * alignment;
}

Result<uint64_t> SectionSize(const std::string& path) {
  struct stat st {};
  UKIFY_EXPECTF(stat(path.c_str(), &st) == 0, "Could not stat \"{}\": {}",
                path, strerror(errno));
  return static_cast<uint64_t>(st.st_size);
}

}  // namespace

Result<std::vector<SectionPlacement>> PlaceSections(
    const PeImage& stub, const std::vector<Section>& sections) {
  UKIFY_EXPECT(!stub.Sections().empty(), "The boot stub has no sections");
  const auto& last = stub.Sections().back();
  const uint64_t alignment = stub.SectionAlignment();
  uint64_t vma = AlignUp(
      stub.ImageBase() + last.virtual_address + last.virtual_size, alignment);

  std::vector<SectionPlacement> placements;
  for (const auto& section : sections) {
    UKIFY_EXPECTF(stub.FindSection(SectionNameToString(section.name)) ==
                      nullptr,
                  "The boot stub already has a {} section",
                  SectionNameToString(section.name));
    auto size = UKIFY_EXPECT(SectionSize(section.path));
    placements.push_back(SectionPlacement{section, vma});
    vma += AlignUp(size, alignment);
  }
  return placements;
}

Result<std::string> ObjcopyAssembler::Assemble(
    const std::string& stub_path, const std::vector<Section>& sections,
    const std::string& work_dir) {
  auto stub = UKIFY_EXPECT(PeImage::Open(stub_path));
  auto placements = UKIFY_EXPECT(PlaceSections(stub, sections));

  auto output = work_dir + "/" + kUnsignedImageName;
  Command objcopy(objcopy_binary_);
  for (const auto& placement : placements) {
    const auto name = SectionNameToString(placement.section.name);
    objcopy.AddParameter("--add-section");
    objcopy.AddParameter(name, "=", placement.section.path);
    objcopy.AddParameter("--change-section-vma");
    objcopy.AddParameter(name, "=", fmt::format("{:#x}", placement.vma));
  }
  objcopy.AddParameter(stub_path);
  objcopy.AddParameter(output);
  auto script = objcopy.AsBashScript();

  std::string out, err;
  int exit_code = RunWithManagedStdio(std::move(objcopy), &out, &err);
  if (exit_code != 0) {
    RemoveFile(output);
    return UKIFY_ERRF("`{}` failed with code {}\nstdout: {}\nstderr: {}",
                      script, exit_code, out, err);
  }
  UKIFY_EXPECTF(FileHasContent(output), "`{}` did not produce \"{}\"", script,
                output);
  return output;
}

}  // namespace ukify
