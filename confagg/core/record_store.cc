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

#include "confagg/core/record_store.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "yacl/base/exception.h"

namespace confagg {

namespace {

// identity -> id of the batch holding its latest record
std::string LatestKey(const Identity& identity) {
  return absl::StrCat("record/", identity);
}

std::string RecordKey(BatchId batch_id, const Identity& identity) {
  return absl::StrCat("batch/", batch_id, "/record/", identity);
}

}  // namespace

void EncryptedRecordStore::Put(BatchId batch_id, const Identity& identity,
                               const EncryptedRecord& record) {
  YACL_ENFORCE(!identity.empty(), "identity must not be empty");
  YACL_ENFORCE_GT(batch_id, 0U, "records belong to an opened batch");

  EncryptedRecordProto proto;
  *proto.mutable_salary() = record.salary.ToProto();
  *proto.mutable_score() = record.score.ToProto();

  std::string value;
  YACL_ENFORCE(proto.SerializeToString(&value));
  store_->Put(RecordKey(batch_id, identity), value);
  store_->Put(LatestKey(identity), absl::StrCat(batch_id));
}

std::optional<EncryptedRecord> EncryptedRecordStore::Get(
    const Identity& identity) const {
  auto latest = store_->Get(LatestKey(identity));
  if (!latest.has_value()) {
    return std::nullopt;
  }
  BatchId batch_id = 0;
  YACL_ENFORCE(absl::SimpleAtoi(*latest, &batch_id),
               "corrupted latest batch of {}", identity);
  return GetInBatch(batch_id, identity);
}

std::optional<EncryptedRecord> EncryptedRecordStore::GetInBatch(
    BatchId batch_id, const Identity& identity) const {
  auto value = store_->Get(RecordKey(batch_id, identity));
  if (!value.has_value()) {
    return std::nullopt;
  }

  EncryptedRecordProto proto;
  YACL_ENFORCE(proto.ParseFromString(*value),
               "record of {} in batch {} couldn't be parsed", identity,
               batch_id);

  EncryptedRecord record;
  record.salary = Ciphertext::FromProto(proto.salary());
  record.score = Ciphertext::FromProto(proto.score());
  return record;
}

}  // namespace confagg
