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

#include <memory>
#include <vector>

#include "confagg/core/batch_registry.h"
#include "confagg/core/record_store.h"
#include "confagg/crypto/he_evaluator.h"

namespace confagg {

struct AggregateCiphertexts {
  Ciphertext total_salary;
  // sum of salary * score
  Ciphertext total_bonus;
  // contributors whose records were folded in
  size_t folded = 0;

  std::vector<Ciphertext> AsVector() const {
    return {total_salary, total_bonus};
  }
};

// Folds the records of a closed batch into encrypted totals. The result is a
// pure function of the contributor list and the records submitted to that
// batch: contributors are visited in insertion order starting from
// EncryptZero(), so the same state always yields byte-identical ciphertexts.
class Aggregator {
 public:
  Aggregator(std::shared_ptr<const IHomomorphicEvaluator> evaluator,
             const BatchRegistry* batches, const EncryptedRecordStore* records)
      : evaluator_(std::move(evaluator)),
        batches_(batches),
        records_(records) {}

  // Throws kInvalidBatch if the batch is open or doesn't exist.
  AggregateCiphertexts Aggregate(BatchId batch_id) const;

 private:
  std::shared_ptr<const IHomomorphicEvaluator> evaluator_;
  const BatchRegistry* batches_;
  const EncryptedRecordStore* records_;
};

}  // namespace confagg
