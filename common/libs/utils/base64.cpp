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

#include "common/libs/utils/base64.h"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include <openssl/evp.h>

#include "common/libs/utils/result.h"

namespace ukify {

Result<std::string> EncodeBase64(std::string_view data) {
  UKIFY_EXPECT_LE(data.size(),
                  static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3),
                  "Too much data to encode");
  // EVP_EncodeBlock writes a terminating NUL
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written =
      EVP_EncodeBlock(reinterpret_cast<uint8_t*>(out.data()),
                      reinterpret_cast<const uint8_t*>(data.data()),
                      data.size());
  UKIFY_EXPECTF(written >= 0, "EVP_EncodeBlock failed on {} bytes",
                data.size());
  out.resize(written);
  return out;
}

Result<std::string> DecodeBase64(std::string_view encoded) {
  UKIFY_EXPECTF(encoded.size() % 4 == 0,
                "Base64 input length {} is not a multiple of 4",
                encoded.size());
  std::string out(encoded.size() / 4 * 3, '\0');
  int written =
      EVP_DecodeBlock(reinterpret_cast<uint8_t*>(out.data()),
                      reinterpret_cast<const uint8_t*>(encoded.data()),
                      encoded.size());
  UKIFY_EXPECT(written >= 0, "Invalid base64 input");

  // EVP_DecodeBlock counts padding as decoded zero bytes.
  size_t padding = 0;
  for (auto it = encoded.rbegin();
       it != encoded.rend() && *it == '=' && padding < 2; ++it) {
    padding++;
  }
  out.resize(written - padding);
  return out;
}

}  // namespace ukify
