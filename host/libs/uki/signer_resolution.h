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

#include <memory>

#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"
#include "host/libs/uki/build_config.h"

namespace ukify {

// The signing capabilities of one build, each present exactly once whatever
// form the configuration supplied it in.
struct ResolvedSigners {
  std::shared_ptr<PcrSigner> pcr;
  std::shared_ptr<CertificateSigner> secure_boot;
};

/**
 * Uses the pre-built signers of `config` where present, and creates the
 * others from the configured key material. Touches no scratch state: a
 * failure here happens before the build creates anything.
 */
Result<ResolvedSigners> ResolveSigners(const BuildConfig& config);

}  // namespace ukify
