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

#include <string>

namespace ukify {

// A minimal os-release(5) file for an image named `name` at `version`.
std::string OsReleaseFor(const std::string& name, const std::string& version);

// The bitmap used as splash image when the build is not given one.
const std::string& DefaultSplashImage();

}  // namespace ukify
