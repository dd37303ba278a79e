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

#include <optional>
#include <string>

#include "confagg/proto/ledger.pb.h"

namespace confagg {

// Opaque homomorphic ciphertext. Either Uninitialized or a serialized value
// produced by an IHomomorphicEvaluator; a default-constructed Ciphertext is
// Uninitialized.
class Ciphertext {
 public:
  Ciphertext() = default;

  explicit Ciphertext(std::string bytes) : value_(std::move(bytes)) {}

  bool IsInitialized() const { return value_.has_value(); }

  const std::string& bytes() const;

  // Short public fingerprint of the ciphertext for events and logs.
  std::string Handle() const;

  CiphertextProto ToProto() const;

  static Ciphertext FromProto(const CiphertextProto& proto);

  bool operator==(const Ciphertext& other) const {
    return value_ == other.value_;
  }
  bool operator!=(const Ciphertext& other) const { return !(*this == other); }

 private:
  std::optional<std::string> value_;
};

}  // namespace confagg
