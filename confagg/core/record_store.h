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
#include <optional>

#include "confagg/core/access_control.h"
#include "confagg/core/batch_registry.h"
#include "confagg/crypto/ciphertext.h"
#include "confagg/store/ledger_store.h"

namespace confagg {

struct EncryptedRecord {
  Ciphertext salary;
  Ciphertext score;

  bool IsComplete() const {
    return salary.IsInitialized() && score.IsInitialized();
  }
};

// One encrypted (salary, score) pair per contributor. A newer submission
// replaces the previous record; records are never deleted or decrypted here.
//
// Each accepted record is kept under the batch it was submitted to, and the
// per-identity view points at the latest of them. Aggregating a batch reads
// its own records only, so resubmitting in a later batch leaves earlier
// batches untouched.
class EncryptedRecordStore {
 public:
  explicit EncryptedRecordStore(std::shared_ptr<ILedgerStore> store)
      : store_(std::move(store)) {}

  void Put(BatchId batch_id, const Identity& identity,
           const EncryptedRecord& record);

  // Latest record of the identity across all batches.
  std::optional<EncryptedRecord> Get(const Identity& identity) const;

  std::optional<EncryptedRecord> GetInBatch(BatchId batch_id,
                                            const Identity& identity) const;

 private:
  std::shared_ptr<ILedgerStore> store_;
};

}  // namespace confagg
