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
#include <string>

#include "confagg/core/aggregator.h"
#include "confagg/core/batch_registry.h"
#include "confagg/oracle/decryption_oracle.h"
#include "confagg/store/ledger_store.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

struct IssuedRequest {
  RequestId request_id = 0;
  BatchId batch_id = 0;
  std::string commitment;
};

struct FinalizedTotals {
  RequestId request_id = 0;
  BatchId batch_id = 0;
  uint64_t total_salary = 0;
  uint64_t total_bonus = 0;
};

// Commit-at-request / re-derive-at-callback handshake with the decryption
// oracle. Pending requests live in the store under "decryption/<id>".
//
// Capability, pause and cooldown gates are the caller's job; this class only
// enforces the batch state and the callback checks, in this order:
//   unknown id -> replay -> expiry -> commitment re-derivation -> proof.
// Every check runs before the context is written.
class DecryptionProtocol {
 public:
  DecryptionProtocol(std::string protocol_instance_id,
                     uint64_t pending_request_ttl_seconds,
                     std::shared_ptr<ILedgerStore> store,
                     const Aggregator* aggregator, BatchRegistry* batches,
                     std::shared_ptr<IDecryptionOracle> oracle);

  // Throws kInvalidBatch if the batch is open or doesn't exist.
  IssuedRequest Request(BatchId batch_id, const Identity& requester,
                        int64_t now);

  FinalizedTotals OnCallback(RequestId request_id,
                             const std::string& cleartexts,
                             const std::string& proof, int64_t now);

  std::optional<DecryptionContextProto> GetContext(
      RequestId request_id) const;

 private:
  void SaveContext(const DecryptionContextProto& context);

  std::string CommitBatch(BatchId batch_id) const;

  std::string protocol_instance_id_;
  uint64_t pending_request_ttl_seconds_;
  std::shared_ptr<ILedgerStore> store_;
  const Aggregator* aggregator_;
  BatchRegistry* batches_;
  std::shared_ptr<IDecryptionOracle> oracle_;
};

}  // namespace confagg
