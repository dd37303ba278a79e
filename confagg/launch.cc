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

#include "confagg/launch.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "google/protobuf/util/json_util.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

#include "confagg/core/access_control.h"
#include "confagg/core/events.h"
#include "confagg/core/ledger.h"
#include "confagg/crypto/commitment.h"
#include "confagg/crypto/seal_bfv.h"
#include "confagg/oracle/local_oracle.h"
#include "confagg/store/ledger_store.h"
#include "confagg/utils/clock.h"
#include "confagg/utils/logging.h"

namespace confagg {

namespace {

std::shared_ptr<ILedgerStore> CreateStore(const std::string& store_path) {
  if (store_path.empty()) {
    return std::make_shared<MemoryLedgerStore>();
  }
  YACL_ENFORCE(!std::filesystem::exists(store_path),
               "store file {} already exists.", store_path);
  return std::make_shared<FileLedgerStore>(store_path);
}

std::shared_ptr<IEventSink> CreateEventSink(const std::string& event_log_path) {
  std::vector<std::shared_ptr<IEventSink>> sinks;
  sinks.push_back(std::make_shared<LoggingEventSink>());
  if (!event_log_path.empty()) {
    sinks.push_back(std::make_shared<JsonLinesEventSink>(event_log_path));
  }
  return std::make_shared<FanoutEventSink>(std::move(sinks));
}

void WriteReport(const AggregationReport& report, const std::string& path) {
  google::protobuf::util::JsonPrintOptions json_print_options;
  json_print_options.preserve_proto_field_names = true;
  std::string report_json;
  YACL_ENFORCE(google::protobuf::util::MessageToJsonString(
                   report, &report_json, json_print_options)
                   .ok());

  std::ofstream out(path, std::ios::out | std::ios::trunc);
  YACL_ENFORCE(out.is_open(), "couldn't open report file {}.", path);
  out << report_json;
}

}  // namespace

AggregationReport RunAggregationRound(const LaunchConfig& launch_config) {
  SetLogLevel(launch_config.logging_level());

  const auto& ledger_config = launch_config.ledger_config();
  const auto& roles = launch_config.roles();
  YACL_ENFORCE(roles.admins_size() > 0, "at least one admin is required.");
  YACL_ENFORCE(roles.providers_size() > 0,
               "at least one provider is required.");
  YACL_ENFORCE(!roles.oracle().empty(), "oracle identity is required.");
  YACL_ENFORCE(launch_config.contributions_size() > 0,
               "no contributions to aggregate.");

  auto bfv_ctx = std::make_shared<SealBfvContext>(ledger_config.he_params());
  auto keys = SealBfvKeys::Generate(*bfv_ctx);
  SPDLOG_INFO("BFV keys generated, poly degree {}, plain modulus {}",
              bfv_ctx->poly_modulus_degree(), bfv_ctx->plain_modulus());

  auto evaluator = std::make_shared<SealBfvEvaluator>(
      bfv_ctx, keys.public_key, keys.relin_keys);
  auto oracle = std::make_shared<LocalDecryptionOracle>(
      bfv_ctx, keys.secret_key, ledger_config.protocol_instance_id());
  auto clock = std::make_shared<ManualClock>(SystemClock().NowSeconds());

  PayrollLedger ledger(ledger_config,
                       CreateStore(ledger_config.store_path()), evaluator,
                       oracle, CreateEventSink(launch_config.event_log_path()),
                       clock);
  AccessControl acl(roles);
  SealBfvEncryptor encryptor(bfv_ctx, keys.public_key);

  const auto& admin = roles.admins(0);
  BatchId batch_id = ledger.OpenBatch(acl, admin);

  for (int i = 0; i < launch_config.contributions_size(); ++i) {
    // Each provider submits once per turn; a new turn starts once every
    // provider has had its go and their cooldowns have run out.
    if (i > 0 && i % roles.providers_size() == 0) {
      clock->Advance(
          static_cast<int64_t>(ledger_config.submission_cooldown_seconds()));
    }
    const auto& provider = roles.providers(i % roles.providers_size());
    const auto& contribution = launch_config.contributions(i);
    ledger.SubmitContribution(acl, provider, contribution.identity(),
                              encryptor.Encrypt(contribution.salary()),
                              encryptor.Encrypt(contribution.score()));
  }

  ledger.CloseBatch(acl, admin);

  RequestId request_id =
      ledger.RequestBatchDecryption(acl, roles.providers(0), batch_id);
  DecryptionResponse response = oracle->Fulfill(request_id);
  FinalizedTotals totals =
      ledger.OnDecryptionCallback(acl, roles.oracle(), response.request_id,
                                  response.cleartexts, response.proof);

  auto batch = ledger.GetBatch(batch_id);
  auto context = ledger.GetDecryptionContext(request_id);
  YACL_ENFORCE(batch.has_value() && context.has_value());

  AggregationReport report;
  report.set_batch_id(batch_id);
  report.set_request_id(request_id);
  report.set_contributor_count(batch->contributor_count());
  report.set_total_salary(totals.total_salary);
  report.set_total_bonus(totals.total_bonus);
  report.set_commitment_hex(CommitmentToHex(context->commitment()));

  if (!launch_config.report_path().empty()) {
    WriteReport(report, launch_config.report_path());
  }
  return report;
}

}  // namespace confagg
