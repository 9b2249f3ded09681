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

#include "host/libs/measure/systemd_measurement.h"

#include <fcntl.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <android-base/macros.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>
#include <fmt/core.h>
#include <json/json.h>

#include "common/libs/utils/base64.h"
#include "common/libs/utils/result.h"
#include "host/libs/signing/signers.h"

namespace ukify {
namespace {

// Order in which systemd-stub measures the sections it finds.
constexpr SectionName kMeasurementOrder[] = {
    SectionName::kKernel, SectionName::kOsRelease, SectionName::kCmdLine,
    SectionName::kInitrd, SectionName::kSplash,    SectionName::kUname,
    SectionName::kSbat,   SectionName::kPcrPublicKey,
};

constexpr uint32_t kTpmCcPolicyPcr = 0x0000017F;
constexpr uint16_t kTpmAlgSha256 = 0x000B;
constexpr uint8_t kPcrSelectSize = 3;
constexpr size_t kReadChunkSize = 1 << 20;

using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX*)>;

void AppendBigEndian32(std::string& out, uint32_t value) {
  out += static_cast<char>((value >> 24) & 0xff);
  out += static_cast<char>((value >> 16) & 0xff);
  out += static_cast<char>((value >> 8) & 0xff);
  out += static_cast<char>(value & 0xff);
}

void AppendBigEndian16(std::string& out, uint16_t value) {
  out += static_cast<char>((value >> 8) & 0xff);
  out += static_cast<char>(value & 0xff);
}

std::string InitialPcrValue() {
  return std::string(SHA256_DIGEST_LENGTH, '\0');
}

}  // namespace

const std::vector<BootPhase>& BootPhases() {
  static const std::vector<BootPhase> kPhases = {
      {"enter-initrd", true},
      {"leave-initrd", false},
      {"sysinit", false},
      {"ready", false},
  };
  return kPhases;
}

std::string Sha256(const std::string& data) {
  std::string digest(SHA256_DIGEST_LENGTH, '\0');
  SHA256(reinterpret_cast<const uint8_t*>(data.data()), data.size(),
         reinterpret_cast<uint8_t*>(digest.data()));
  return digest;
}

Result<std::string> Sha256File(const std::string& path) {
  android::base::unique_fd fd(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  UKIFY_EXPECTF(fd.get() >= 0, "Could not open \"{}\": {}", path,
                strerror(errno));
  DigestCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
  UKIFY_EXPECT(ctx.get() != nullptr, "EVP_MD_CTX_new failed");
  UKIFY_EXPECT(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1,
               "EVP_DigestInit_ex failed: " << CollectSslErrors());
  std::vector<char> buffer(kReadChunkSize);
  while (true) {
    ssize_t bytes_read =
        TEMP_FAILURE_RETRY(read(fd.get(), buffer.data(), buffer.size()));
    UKIFY_EXPECTF(bytes_read >= 0, "Could not read \"{}\": {}", path,
                  strerror(errno));
    if (bytes_read == 0) {
      break;
    }
    UKIFY_EXPECT(EVP_DigestUpdate(ctx.get(), buffer.data(), bytes_read) == 1,
                 "EVP_DigestUpdate failed: " << CollectSslErrors());
  }
  std::string digest(SHA256_DIGEST_LENGTH, '\0');
  unsigned int length = 0;
  UKIFY_EXPECT(
      EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<uint8_t*>(digest.data()),
                         &length) == 1,
      "EVP_DigestFinal_ex failed: " << CollectSslErrors());
  digest.resize(length);
  return digest;
}

std::string HexString(const std::string& bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    out += fmt::format("{:02x}", static_cast<uint8_t>(c));
  }
  return out;
}

void ExtendPcr(std::string& pcr_value, const std::string& digest) {
  pcr_value = Sha256(pcr_value + digest);
}

Result<std::string> MeasureSections(const MeasuredSections& sections) {
  UKIFY_EXPECT(sections.count(SectionName::kPcrSig) == 0,
               "The measurement signature cannot be measured");
  auto pcr_value = InitialPcrValue();
  for (const auto& name : kMeasurementOrder) {
    auto it = sections.find(name);
    if (it == sections.end()) {
      continue;
    }
    // The stub includes the terminating NUL of the section name.
    ExtendPcr(pcr_value, Sha256(SectionNameToString(name) + '\0'));
    auto content_digest = UKIFY_EXPECTF(
        Sha256File(it->second), "Failed to measure section {}",
        SectionNameToString(name));
    ExtendPcr(pcr_value, content_digest);
  }
  return pcr_value;
}

Result<std::string> PolicyPcrDigest(const std::string& pcr_value, int pcr) {
  UKIFY_EXPECTF(pcr >= 0 && pcr < kPcrSelectSize * 8,
                "PCR {} is out of range", pcr);
  UKIFY_EXPECT_EQ(pcr_value.size(), static_cast<size_t>(SHA256_DIGEST_LENGTH),
                  "PCR value is not a SHA-256 digest");

  std::string policy_input = InitialPcrValue();
  AppendBigEndian32(policy_input, kTpmCcPolicyPcr);
  // TPML_PCR_SELECTION with a single TPMS_PCR_SELECTION
  AppendBigEndian32(policy_input, 1);
  AppendBigEndian16(policy_input, kTpmAlgSha256);
  std::string select(kPcrSelectSize, '\0');
  select[pcr / 8] = static_cast<char>(1 << (pcr % 8));
  policy_input += static_cast<char>(kPcrSelectSize);
  policy_input += select;
  // Digest of the concatenated values of the selected PCRs
  policy_input += Sha256(pcr_value);
  return Sha256(policy_input);
}

Result<Json::Value> SystemdMeasurementEngine::GenerateSignedMeasurement(
    const MeasuredSections& sections, const PcrSigner& signer, int pcr) {
  auto public_key = UKIFY_EXPECT(signer.PublicKeyDer());
  auto fingerprint = HexString(Sha256(public_key));

  auto pcr_value = UKIFY_EXPECT(MeasureSections(sections));
  Json::Value bank(Json::arrayValue);
  for (const auto& phase : BootPhases()) {
    ExtendPcr(pcr_value, Sha256(phase.name));
    if (!phase.sign) {
      continue;
    }
    auto policy = UKIFY_EXPECT(PolicyPcrDigest(pcr_value, pcr));
    auto signature = UKIFY_EXPECTF(signer.SignDigest(policy),
                                   "Failed to sign the policy of phase {}",
                                   phase.name);
    auto encoded = UKIFY_EXPECT(EncodeBase64(signature),
                                "Failed to encode the policy signature");

    Json::Value entry(Json::objectValue);
    entry["pcrs"] = Json::Value(Json::arrayValue);
    entry["pcrs"].append(pcr);
    entry["pkfp"] = fingerprint;
    entry["pol"] = HexString(policy);
    entry["sig"] = encoded;
    bank.append(entry);
  }

  Json::Value measurement(Json::objectValue);
  measurement["sha256"] = bank;
  return measurement;
}

Result<void> SystemdMeasurementEngine::PrintMeasurements(
    const std::string& phase_path, const MeasuredSections& sections,
    const BuildLogger& logger) {
  auto pcr_value = UKIFY_EXPECT(MeasureSections(sections));
  BUILD_LOG(logger, DEBUG) << "PCR " << kUkiPcr
                           << " after sections: " << HexString(pcr_value);
  for (const auto& phase : android::base::Split(phase_path, ":")) {
    if (phase.empty()) {
      continue;
    }
    ExtendPcr(pcr_value, Sha256(phase));
    BUILD_LOG(logger, DEBUG) << "PCR " << kUkiPcr << " after " << phase
                             << ": " << HexString(pcr_value);
  }
  return {};
}

}  // namespace ukify
