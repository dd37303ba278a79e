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

#include "confagg/core/ledger.h"

#include <utility>

#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

#include "confagg/core/errors.h"
#include "confagg/crypto/commitment.h"

namespace confagg {

namespace {

// Runs one entry point under the ledger lock. Rejections are logged with
// their code and rethrown unchanged.
template <typename Fn>
auto RunLocked(std::mutex& mutex, const char* op, Fn&& fn) -> decltype(fn()) {
  std::lock_guard<std::mutex> lock(mutex);
  try {
    return fn();
  } catch (const ProtocolError& e) {
    SPDLOG_WARN("{} rejected, category {}: {}", op,
                ErrorCategoryName(e.category()), e.what());
    throw;
  }
}

}  // namespace

PayrollLedger::PayrollLedger(
    LedgerConfig config, std::shared_ptr<ILedgerStore> store,
    std::shared_ptr<const IHomomorphicEvaluator> evaluator,
    std::shared_ptr<IDecryptionOracle> oracle,
    std::shared_ptr<IEventSink> events, std::shared_ptr<IClock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      evaluator_(std::move(evaluator)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      batches_(store_),
      records_(store_),
      cooldowns_(store_),
      aggregator_(evaluator_, &batches_, &records_),
      decryption_(config_.protocol_instance_id(),
                  config_.pending_request_ttl_seconds(), store_, &aggregator_,
                  &batches_, std::move(oracle)) {
  YACL_ENFORCE(store_ != nullptr, "ledger store is required");
  YACL_ENFORCE(evaluator_ != nullptr, "homomorphic evaluator is required");
  YACL_ENFORCE(events_ != nullptr, "event sink is required");
  YACL_ENFORCE(clock_ != nullptr, "clock is required");
  YACL_ENFORCE(store_->Verify(), "ledger store failed verification");

  SPDLOG_INFO(
      "payroll ledger {} ready, current batch {}, submission cooldown {}s, "
      "decryption cooldown {}s, request ttl {}s",
      config_.protocol_instance_id(), batches_.current_id(),
      config_.submission_cooldown_seconds(),
      config_.decryption_cooldown_seconds(),
      config_.pending_request_ttl_seconds());
}

BatchId PayrollLedger::OpenBatch(const AccessControl& acl,
                                 const Identity& caller) {
  return RunLocked(mutex_, "OpenBatch", [&] {
    acl.RequireAdmin(caller);
    acl.RequireNotPaused();

    auto result = batches_.Open();
    if (result.closed.has_value()) {
      LedgerEvent closed;
      closed.mutable_batch_closed()->set_batch_id(*result.closed);
      Emit(std::move(closed));
    }

    LedgerEvent opened;
    opened.mutable_batch_opened()->set_batch_id(result.opened);
    Emit(std::move(opened));

    SPDLOG_INFO("{} opened batch {}", caller, result.opened);
    return result.opened;
  });
}

BatchId PayrollLedger::CloseBatch(const AccessControl& acl,
                                  const Identity& caller) {
  return RunLocked(mutex_, "CloseBatch", [&] {
    acl.RequireAdmin(caller);
    acl.RequireNotPaused();

    BatchId id = batches_.Close();

    LedgerEvent event;
    event.mutable_batch_closed()->set_batch_id(id);
    Emit(std::move(event));

    SPDLOG_INFO("{} closed batch {}", caller, id);
    return id;
  });
}

void PayrollLedger::SubmitContribution(const AccessControl& acl,
                                       const Identity& caller,
                                       const Identity& identity,
                                       const Ciphertext& salary,
                                       const Ciphertext& score) {
  RunLocked(mutex_, "SubmitContribution", [&] {
    YACL_ENFORCE(!identity.empty(), "contributor identity must not be empty");
    acl.RequireProvider(caller);
    acl.RequireNotPaused();

    int64_t now = clock_->NowSeconds();
    cooldowns_.Check(CooldownKind::kSubmission, caller,
                     config_.submission_cooldown_seconds(), now);

    BatchId batch_id = batches_.current_id();
    if (!batches_.IsCurrentOpen()) {
      CONFAGG_THROW(ErrorCode::kInvalidBatch, "no batch is open");
    }
    if (batches_.HasContributed(batch_id, identity)) {
      CONFAGG_THROW(ErrorCode::kDuplicateContribution,
                    "{} already contributed to batch {}", identity, batch_id);
    }

    // Anything the evaluator can't use, including bytes that don't load,
    // counts as an encrypted zero.
    EncryptedRecord record;
    record.salary = evaluator_->IsInitialized(salary)
                        ? salary
                        : evaluator_->EncryptZero();
    record.score =
        evaluator_->IsInitialized(score) ? score : evaluator_->EncryptZero();

    records_.Put(batch_id, identity, record);
    batches_.AddContributor(batch_id, identity);
    cooldowns_.Touch(CooldownKind::kSubmission, caller, now);

    LedgerEvent event;
    auto* submitted = event.mutable_contribution_submitted();
    submitted->set_identity(identity);
    submitted->set_provider(caller);
    submitted->set_batch_id(batch_id);
    submitted->set_salary_handle(record.salary.Handle());
    submitted->set_score_handle(record.score.Handle());
    Emit(std::move(event));

    SPDLOG_INFO("{} submitted a contribution for {} to batch {}", caller,
                identity, batch_id);
  });
}

RequestId PayrollLedger::RequestBatchDecryption(const AccessControl& acl,
                                                const Identity& caller,
                                                BatchId batch_id) {
  return RunLocked(mutex_, "RequestBatchDecryption", [&] {
    acl.RequireProvider(caller);
    acl.RequireNotPaused();

    int64_t now = clock_->NowSeconds();
    cooldowns_.Check(CooldownKind::kDecryptionRequest, caller,
                     config_.decryption_cooldown_seconds(), now);

    auto issued = decryption_.Request(batch_id, caller, now);
    cooldowns_.Touch(CooldownKind::kDecryptionRequest, caller, now);

    LedgerEvent event;
    auto* requested = event.mutable_decryption_requested();
    requested->set_request_id(issued.request_id);
    requested->set_batch_id(issued.batch_id);
    requested->set_commitment_hex(CommitmentToHex(issued.commitment));
    Emit(std::move(event));

    SPDLOG_INFO("{} requested decryption of batch {}, request id {}", caller,
                batch_id, issued.request_id);
    return issued.request_id;
  });
}

FinalizedTotals PayrollLedger::OnDecryptionCallback(
    const AccessControl& acl, const Identity& caller, RequestId request_id,
    const std::string& cleartexts, const std::string& proof) {
  return RunLocked(mutex_, "OnDecryptionCallback", [&] {
    acl.RequireOracle(caller);

    auto totals = decryption_.OnCallback(request_id, cleartexts, proof,
                                         clock_->NowSeconds());

    LedgerEvent event;
    auto* completed = event.mutable_decryption_completed();
    completed->set_request_id(totals.request_id);
    completed->set_batch_id(totals.batch_id);
    completed->set_total_salary(totals.total_salary);
    completed->set_total_bonus(totals.total_bonus);
    Emit(std::move(event));

    SPDLOG_INFO("request {} finalized batch {}", request_id, totals.batch_id);
    return totals;
  });
}

void PayrollLedger::Pause(AccessControl& acl, const Identity& caller) {
  RunLocked(mutex_, "Pause", [&] {
    acl.Pause(caller);

    LedgerEvent event;
    event.mutable_pause_changed()->set_paused(true);
    event.mutable_pause_changed()->set_by(caller);
    Emit(std::move(event));

    SPDLOG_INFO("{} paused the ledger", caller);
  });
}

void PayrollLedger::Unpause(AccessControl& acl, const Identity& caller) {
  RunLocked(mutex_, "Unpause", [&] {
    acl.Unpause(caller);

    LedgerEvent event;
    event.mutable_pause_changed()->set_paused(false);
    event.mutable_pause_changed()->set_by(caller);
    Emit(std::move(event));

    SPDLOG_INFO("{} unpaused the ledger", caller);
  });
}

bool PayrollLedger::IsAvailable(const AccessControl& acl) const {
  return !acl.IsPaused();
}

BatchId PayrollLedger::current_batch_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_.current_id();
}

std::optional<BatchProto> PayrollLedger::GetBatch(BatchId batch_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return batches_.Get(batch_id);
}

std::optional<EncryptedRecord> PayrollLedger::GetRecord(
    const Identity& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.Get(identity);
}

std::optional<DecryptionContextProto> PayrollLedger::GetDecryptionContext(
    RequestId request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decryption_.GetContext(request_id);
}

AggregateCiphertexts PayrollLedger::Aggregate(BatchId batch_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return aggregator_.Aggregate(batch_id);
}

void PayrollLedger::Emit(LedgerEvent event) {
  event.set_timestamp(clock_->NowSeconds());
  events_->Emit(event);
}

}  // namespace confagg
