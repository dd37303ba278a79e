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

#include "confagg/crypto/ciphertext.h"

namespace confagg {

// Homomorphic operations the ledger needs. Implementations hold public
// evaluation material only and never decrypt.
class IHomomorphicEvaluator {
 public:
  virtual ~IHomomorphicEvaluator() = default;

  // An encryption of zero that stays the same for the lifetime of the
  // evaluator, so folding from it is reproducible.
  virtual Ciphertext EncryptZero() const = 0;

  // True if ct holds a valid ciphertext for this evaluator's parameters that
  // Add and Multiply accept.
  virtual bool IsInitialized(const Ciphertext& ct) const = 0;

  // Deterministic: equal inputs give byte-identical outputs.
  virtual Ciphertext Add(const Ciphertext& a, const Ciphertext& b) const = 0;

  // Deterministic: equal inputs give byte-identical outputs.
  virtual Ciphertext Multiply(const Ciphertext& a,
                              const Ciphertext& b) const = 0;
};

}  // namespace confagg
