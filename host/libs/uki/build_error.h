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

#include <ostream>
#include <string>

#include <android-base/expected.h>

#include "common/libs/utils/result.h"

namespace ukify {

enum class BuildErrorKind {
  // Missing or inconsistent inputs, detected before anything is written.
  kConfiguration,
  kIo,
  kSigning,
  kMeasurement,
  kAssembly,
};

std::string BuildErrorKindToString(BuildErrorKind kind);
std::ostream& operator<<(std::ostream& out, BuildErrorKind kind);

struct BuildError {
  BuildErrorKind kind;
  // Identity of the failing step, e.g. "splash" or "sign".
  std::string stage;
  StackTraceError error;

  // "<kind> error in stage <stage>: <message>"
  std::string Message() const;
};

using BuildResult = android::base::expected<void, BuildError>;

}  // namespace ukify
