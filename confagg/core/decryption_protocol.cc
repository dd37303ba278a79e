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

#include "confagg/core/decryption_protocol.h"

#include <utility>

#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

#include "confagg/core/errors.h"
#include "confagg/crypto/commitment.h"

namespace confagg {

namespace {

// salary total, bonus total
constexpr size_t kCleartextCount = 2;

std::string ContextKey(RequestId request_id) {
  return absl::StrCat("decryption/", request_id);
}

}  // namespace

DecryptionProtocol::DecryptionProtocol(
    std::string protocol_instance_id, uint64_t pending_request_ttl_seconds,
    std::shared_ptr<ILedgerStore> store, const Aggregator* aggregator,
    BatchRegistry* batches, std::shared_ptr<IDecryptionOracle> oracle)
    : protocol_instance_id_(std::move(protocol_instance_id)),
      pending_request_ttl_seconds_(pending_request_ttl_seconds),
      store_(std::move(store)),
      aggregator_(aggregator),
      batches_(batches),
      oracle_(std::move(oracle)) {
  YACL_ENFORCE(!protocol_instance_id_.empty(),
               "protocol instance id must not be empty");
  YACL_ENFORCE(aggregator_ != nullptr && batches_ != nullptr);
  YACL_ENFORCE(oracle_ != nullptr, "decryption oracle is required");
}

std::string DecryptionProtocol::CommitBatch(BatchId batch_id) const {
  auto totals = aggregator_->Aggregate(batch_id);
  return ComputeCommitment(totals.AsVector(), protocol_instance_id_);
}

IssuedRequest DecryptionProtocol::Request(BatchId batch_id,
                                          const Identity& requester,
                                          int64_t now) {
  auto totals = aggregator_->Aggregate(batch_id);
  auto ciphertexts = totals.AsVector();
  std::string commitment =
      ComputeCommitment(ciphertexts, protocol_instance_id_);

  // The oracle assigns the id, so the context can only be saved afterwards.
  // If saving fails the oracle keeps a request the ledger never recorded;
  // its callback gets kUnknownRequest and the batch can be requested again.
  RequestId request_id = oracle_->RequestDecryption(ciphertexts);
  YACL_ENFORCE(!store_->Has(ContextKey(request_id)),
               "oracle reissued request id {}", request_id);

  DecryptionContextProto context;
  context.set_request_id(request_id);
  context.set_batch_id(batch_id);
  context.set_commitment(commitment);
  context.set_processed(false);
  context.set_requester(requester);
  context.set_requested_at(now);
  SaveContext(context);

  SPDLOG_DEBUG("request {} commits batch {} to {}", request_id, batch_id,
               CommitmentToHex(commitment));

  IssuedRequest issued;
  issued.request_id = request_id;
  issued.batch_id = batch_id;
  issued.commitment = std::move(commitment);
  return issued;
}

FinalizedTotals DecryptionProtocol::OnCallback(RequestId request_id,
                                               const std::string& cleartexts,
                                               const std::string& proof,
                                               int64_t now) {
  auto context = GetContext(request_id);
  if (!context.has_value()) {
    CONFAGG_THROW(ErrorCode::kUnknownRequest, "request {} was never issued",
                  request_id);
  }

  // Must stay first so replays are rejected without recomputation.
  if (context->processed()) {
    CONFAGG_THROW(ErrorCode::kReplayAttempt, "request {} already finalized",
                  request_id);
  }

  if (pending_request_ttl_seconds_ > 0 &&
      now > context->requested_at() +
                static_cast<int64_t>(pending_request_ttl_seconds_)) {
    CONFAGG_THROW(ErrorCode::kRequestExpired,
                  "request {} expired {} seconds ago", request_id,
                  now - context->requested_at() -
                      static_cast<int64_t>(pending_request_ttl_seconds_));
  }

  std::string recomputed = CommitBatch(context->batch_id());
  if (recomputed != context->commitment()) {
    SPDLOG_DEBUG("request {}: committed {} recomputed {}", request_id,
                 CommitmentToHex(context->commitment()),
                 CommitmentToHex(recomputed));
    CONFAGG_THROW(ErrorCode::kStateMismatch,
                  "batch {} changed since request {} was issued",
                  context->batch_id(), request_id);
  }

  if (!oracle_->VerifyProof(request_id, cleartexts, proof)) {
    CONFAGG_THROW(ErrorCode::kProofVerificationFailed,
                  "oracle proof for request {} rejected", request_id);
  }

  // The proof covers these bytes, so a malformed payload here means the
  // oracle itself signed garbage.
  auto values = DecodeCleartexts(cleartexts);
  YACL_ENFORCE_EQ(values.size(), kCleartextCount,
                  "request {} carries a wrong number of cleartexts",
                  request_id);

  context->set_processed(true);
  context->set_total_salary(values[0]);
  context->set_total_bonus(values[1]);
  SaveContext(*context);
  batches_->MarkFinalized(context->batch_id(), values[0], values[1]);

  FinalizedTotals totals;
  totals.request_id = request_id;
  totals.batch_id = context->batch_id();
  totals.total_salary = values[0];
  totals.total_bonus = values[1];
  return totals;
}

std::optional<DecryptionContextProto> DecryptionProtocol::GetContext(
    RequestId request_id) const {
  auto value = store_->Get(ContextKey(request_id));
  if (!value.has_value()) {
    return std::nullopt;
  }
  DecryptionContextProto context;
  YACL_ENFORCE(context.ParseFromString(*value),
               "decryption context {} couldn't be parsed", request_id);
  return context;
}

void DecryptionProtocol::SaveContext(const DecryptionContextProto& context) {
  std::string value;
  YACL_ENFORCE(context.SerializeToString(&value));
  store_->Put(ContextKey(context.request_id()), value);
}

}  // namespace confagg
