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

#include <string>
#include <vector>

#include "confagg/crypto/ciphertext.h"

namespace confagg {

inline constexpr size_t kCommitmentSize = 32;

// SHA-256 over the length-prefixed ciphertexts followed by the
// length-prefixed protocol instance id. Binds a decryption request to the
// exact ciphertexts it was issued against and to one deployment.
std::string ComputeCommitment(const std::vector<Ciphertext>& ciphertexts,
                              const std::string& protocol_instance_id);

std::string CommitmentToHex(const std::string& commitment);

}  // namespace confagg
