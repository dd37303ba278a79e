// Copyright 2025 Ant Group Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "confagg/crypto/commitment.h"

#include <array>
#include <cstdint>

#include "absl/strings/escaping.h"
#include "yacl/base/exception.h"
#include "yacl/crypto/hash/ssl_hash.h"

namespace confagg {

namespace {

std::array<uint8_t, sizeof(uint64_t)> EncodeLength(uint64_t len) {
  std::array<uint8_t, sizeof(uint64_t)> out;
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(len >> (8 * i));
  }
  return out;
}

}  // namespace

std::string ComputeCommitment(const std::vector<Ciphertext>& ciphertexts,
                              const std::string& protocol_instance_id) {
  YACL_ENFORCE(!protocol_instance_id.empty(),
               "protocol instance id must not be empty");

  yacl::crypto::Sha256Hash hash;
  for (const auto& ct : ciphertexts) {
    YACL_ENFORCE(ct.IsInitialized(),
                 "cannot commit to an uninitialized ciphertext");
    auto len = EncodeLength(ct.bytes().size());
    hash.Update(yacl::ByteContainerView(len.data(), len.size()));
    hash.Update(ct.bytes());
  }
  auto len = EncodeLength(protocol_instance_id.size());
  hash.Update(yacl::ByteContainerView(len.data(), len.size()));
  hash.Update(protocol_instance_id);

  std::vector<uint8_t> digest = hash.CumulativeHash();
  YACL_ENFORCE_EQ(digest.size(), kCommitmentSize);
  return std::string(digest.begin(), digest.end());
}

std::string CommitmentToHex(const std::string& commitment) {
  return absl::BytesToHexString(commitment);
}

}  // namespace confagg
