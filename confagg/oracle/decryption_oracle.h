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

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "confagg/crypto/ciphertext.h"

namespace confagg {

using RequestId = uint64_t;

// What the oracle hands back out of band for one request.
struct DecryptionResponse {
  RequestId request_id = 0;
  // Serialized DecryptionCleartexts.
  std::string cleartexts;
  std::string proof;
};

// External decryption network. RequestDecryption is fire-and-forget; the
// answer reaches the ledger later through PayrollLedger::OnDecryptionCallback.
class IDecryptionOracle {
 public:
  virtual ~IDecryptionOracle() = default;

  virtual RequestId RequestDecryption(
      const std::vector<Ciphertext>& ciphertexts) = 0;

  virtual bool VerifyProof(RequestId request_id, const std::string& cleartexts,
                           const std::string& proof) const = 0;
};

std::string EncodeCleartexts(const std::vector<uint64_t>& values);

std::vector<uint64_t> DecodeCleartexts(const std::string& cleartexts);

}  // namespace confagg
