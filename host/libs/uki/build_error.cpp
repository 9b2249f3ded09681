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

#include "host/libs/uki/build_error.h"

#include <ostream>
#include <string>

#include <fmt/core.h>

namespace ukify {

std::string BuildErrorKindToString(BuildErrorKind kind) {
  switch (kind) {
    case BuildErrorKind::kConfiguration:
      return "configuration";
    case BuildErrorKind::kIo:
      return "I/O";
    case BuildErrorKind::kSigning:
      return "signing";
    case BuildErrorKind::kMeasurement:
      return "measurement";
    case BuildErrorKind::kAssembly:
      return "assembly";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& out, BuildErrorKind kind) {
  return out << BuildErrorKindToString(kind);
}

std::string BuildError::Message() const {
  return fmt::format("{} error in stage {}: {}", BuildErrorKindToString(kind),
                     stage, error.Message());
}

}  // namespace ukify
