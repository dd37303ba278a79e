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
#include <memory>
#include <optional>
#include <vector>

#include "confagg/core/access_control.h"
#include "confagg/store/ledger_store.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

using BatchId = uint64_t;

// Batch lifecycle: ids start at 1 and grow by one per Open. Each batch goes
// Open -> Closed exactly once and is never reopened or deleted.
class BatchRegistry {
 public:
  struct OpenResult {
    BatchId opened = 0;
    // Set when the previous current batch was still open and got closed.
    std::optional<BatchId> closed;
  };

  explicit BatchRegistry(std::shared_ptr<ILedgerStore> store)
      : store_(std::move(store)) {}

  // 0 until the first batch is opened.
  BatchId current_id() const;

  OpenResult Open();

  // Closes the current batch. Throws kInvalidBatchState if there is none or
  // it is already closed.
  BatchId Close();

  std::optional<BatchProto> Get(BatchId id) const;

  bool IsCurrentOpen() const;

  bool HasContributed(BatchId id, const Identity& identity) const;

  // Callers check IsCurrentOpen and HasContributed first. Writes a constant
  // number of entries regardless of the batch size.
  void AddContributor(BatchId id, const Identity& identity);

  // Members in insertion order.
  std::vector<Identity> Contributors(BatchId id) const;

  // Throws kInvalidBatch unless the batch exists and is closed.
  BatchProto GetClosed(BatchId id) const;

  void MarkFinalized(BatchId id, uint64_t total_salary, uint64_t total_bonus);

 private:
  void Save(const BatchProto& batch);

  std::shared_ptr<ILedgerStore> store_;
};

}  // namespace confagg
