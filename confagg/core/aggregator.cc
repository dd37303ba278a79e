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

#include "confagg/core/aggregator.h"

#include "spdlog/spdlog.h"

namespace confagg {

AggregateCiphertexts Aggregator::Aggregate(BatchId batch_id) const {
  BatchProto batch = batches_->GetClosed(batch_id);

  AggregateCiphertexts result;
  result.total_salary = evaluator_->EncryptZero();
  result.total_bonus = evaluator_->EncryptZero();

  for (const auto& identity : batches_->Contributors(batch_id)) {
    auto record = records_->GetInBatch(batch_id, identity);
    // Submissions coerce missing values to zero, so this only triggers if
    // the store was written behind the ledger's back.
    if (!record.has_value() || !evaluator_->IsInitialized(record->salary) ||
        !evaluator_->IsInitialized(record->score)) {
      SPDLOG_WARN("batch {}: skip incomplete record of {}", batch_id,
                  identity);
      continue;
    }

    result.total_salary =
        evaluator_->Add(result.total_salary, record->salary);
    result.total_bonus = evaluator_->Add(
        result.total_bonus,
        evaluator_->Multiply(record->salary, record->score));
    result.folded++;
  }

  SPDLOG_DEBUG("batch {}: folded {} of {} contributors", batch_id,
               result.folded, batch.contributor_count());
  return result;
}

}  // namespace confagg
