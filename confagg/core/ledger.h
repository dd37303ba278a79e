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
#include <mutex>
#include <optional>
#include <string>

#include "confagg/core/access_control.h"
#include "confagg/core/aggregator.h"
#include "confagg/core/batch_registry.h"
#include "confagg/core/cooldown.h"
#include "confagg/core/decryption_protocol.h"
#include "confagg/core/events.h"
#include "confagg/core/record_store.h"
#include "confagg/crypto/he_evaluator.h"
#include "confagg/oracle/decryption_oracle.h"
#include "confagg/store/ledger_store.h"
#include "confagg/utils/clock.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

// Confidential payroll ledger. Providers submit encrypted (salary, score)
// pairs into batches opened and closed by admins; a closed batch can be
// aggregated homomorphically and decrypted through the oracle handshake.
//
// Every entry point runs under one lock and either applies completely or
// throws a ProtocolError without writing anything.
class PayrollLedger {
 public:
  PayrollLedger(LedgerConfig config, std::shared_ptr<ILedgerStore> store,
                std::shared_ptr<const IHomomorphicEvaluator> evaluator,
                std::shared_ptr<IDecryptionOracle> oracle,
                std::shared_ptr<IEventSink> events,
                std::shared_ptr<IClock> clock);

  // Admin. Returns the new batch id.
  BatchId OpenBatch(const AccessControl& acl, const Identity& caller);

  // Admin. Returns the id of the closed batch.
  BatchId CloseBatch(const AccessControl& acl, const Identity& caller);

  // Provider. Uninitialized ciphertexts are stored as encryptions of zero.
  void SubmitContribution(const AccessControl& acl, const Identity& caller,
                          const Identity& identity, const Ciphertext& salary,
                          const Ciphertext& score);

  // Provider. Returns the oracle's request id.
  RequestId RequestBatchDecryption(const AccessControl& acl,
                                   const Identity& caller, BatchId batch_id);

  // Oracle only.
  FinalizedTotals OnDecryptionCallback(const AccessControl& acl,
                                       const Identity& caller,
                                       RequestId request_id,
                                       const std::string& cleartexts,
                                       const std::string& proof);

  void Pause(AccessControl& acl, const Identity& caller);

  void Unpause(AccessControl& acl, const Identity& caller);

  bool IsAvailable(const AccessControl& acl) const;

  BatchId current_batch_id() const;

  std::optional<BatchProto> GetBatch(BatchId batch_id) const;

  std::optional<EncryptedRecord> GetRecord(const Identity& identity) const;

  std::optional<DecryptionContextProto> GetDecryptionContext(
      RequestId request_id) const;

  // Encrypted totals of a closed batch. Throws kInvalidBatch otherwise.
  AggregateCiphertexts Aggregate(BatchId batch_id) const;

  const LedgerConfig& config() const { return config_; }

 private:
  void Emit(LedgerEvent event);

  LedgerConfig config_;
  std::shared_ptr<ILedgerStore> store_;
  std::shared_ptr<const IHomomorphicEvaluator> evaluator_;
  std::shared_ptr<IEventSink> events_;
  std::shared_ptr<IClock> clock_;

  BatchRegistry batches_;
  EncryptedRecordStore records_;
  CooldownTracker cooldowns_;
  Aggregator aggregator_;
  DecryptionProtocol decryption_;

  mutable std::mutex mutex_;
};

}  // namespace confagg
