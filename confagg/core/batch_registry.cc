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

#include "confagg/core/batch_registry.h"

#include <utility>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

#include "confagg/core/errors.h"

namespace confagg {

namespace {

constexpr char kCurrentBatchKey[] = "batch/current";

std::string BatchKey(BatchId id) { return absl::StrCat("batch/", id); }

std::string MemberKey(BatchId id, const Identity& identity) {
  return absl::StrCat("batch/", id, "/member/", identity);
}

std::string MemberIndexKey(BatchId id, uint64_t index) {
  return absl::StrCat("batch/", id, "/member#", index);
}

}  // namespace

BatchId BatchRegistry::current_id() const {
  auto value = store_->Get(kCurrentBatchKey);
  if (!value.has_value()) {
    return 0;
  }
  BatchId id = 0;
  YACL_ENFORCE(absl::SimpleAtoi(*value, &id), "corrupted current batch id {}",
               *value);
  return id;
}

BatchRegistry::OpenResult BatchRegistry::Open() {
  OpenResult result;
  BatchId prev_id = current_id();
  if (prev_id != 0) {
    auto prev = Get(prev_id);
    YACL_ENFORCE(prev.has_value(), "current batch {} is missing", prev_id);
    if (prev->state() == BatchProto::STATE_OPEN) {
      prev->set_state(BatchProto::STATE_CLOSED);
      Save(*prev);
      result.closed = prev_id;
      SPDLOG_INFO("batch {} closed implicitly by opening its successor",
                  prev_id);
    }
  }

  BatchProto batch;
  batch.set_id(prev_id + 1);
  batch.set_state(BatchProto::STATE_OPEN);
  Save(batch);
  store_->Put(kCurrentBatchKey, absl::StrCat(batch.id()));

  result.opened = batch.id();
  return result;
}

BatchId BatchRegistry::Close() {
  BatchId id = current_id();
  std::optional<BatchProto> batch;
  if (id != 0) {
    batch = Get(id);
  }
  if (!batch.has_value()) {
    CONFAGG_THROW(ErrorCode::kInvalidBatchState, "no batch has been opened");
  }
  if (batch->state() != BatchProto::STATE_OPEN) {
    CONFAGG_THROW(ErrorCode::kInvalidBatchState, "batch {} is already closed",
                  id);
  }
  batch->set_state(BatchProto::STATE_CLOSED);
  Save(*batch);
  return id;
}

std::optional<BatchProto> BatchRegistry::Get(BatchId id) const {
  auto value = store_->Get(BatchKey(id));
  if (!value.has_value()) {
    return std::nullopt;
  }
  BatchProto batch;
  YACL_ENFORCE(batch.ParseFromString(*value), "batch {} couldn't be parsed",
               id);
  return batch;
}

bool BatchRegistry::IsCurrentOpen() const {
  BatchId id = current_id();
  if (id == 0) {
    return false;
  }
  auto batch = Get(id);
  return batch.has_value() && batch->state() == BatchProto::STATE_OPEN;
}

bool BatchRegistry::HasContributed(BatchId id, const Identity& identity) const {
  return store_->Has(MemberKey(id, identity));
}

void BatchRegistry::AddContributor(BatchId id, const Identity& identity) {
  auto batch = Get(id);
  YACL_ENFORCE(batch.has_value() && batch->state() == BatchProto::STATE_OPEN,
               "batch {} is not open", id);
  YACL_ENFORCE(!HasContributed(id, identity), "{} already in batch {}",
               identity, id);

  uint64_t index = batch->contributor_count();
  store_->Put(MemberIndexKey(id, index), identity);
  store_->Put(MemberKey(id, identity), absl::StrCat(index));
  batch->set_contributor_count(index + 1);
  Save(*batch);
}

std::vector<Identity> BatchRegistry::Contributors(BatchId id) const {
  auto batch = Get(id);
  if (!batch.has_value()) {
    return {};
  }
  std::vector<Identity> contributors;
  contributors.reserve(batch->contributor_count());
  for (uint64_t i = 0; i < batch->contributor_count(); ++i) {
    auto identity = store_->Get(MemberIndexKey(id, i));
    YACL_ENFORCE(identity.has_value(), "batch {} is missing member #{}", id,
                 i);
    contributors.push_back(std::move(*identity));
  }
  return contributors;
}

BatchProto BatchRegistry::GetClosed(BatchId id) const {
  auto batch = Get(id);
  if (!batch.has_value()) {
    CONFAGG_THROW(ErrorCode::kInvalidBatch, "batch {} doesn't exist", id);
  }
  if (batch->state() != BatchProto::STATE_CLOSED) {
    CONFAGG_THROW(ErrorCode::kInvalidBatch, "batch {} is still open", id);
  }
  return *batch;
}

void BatchRegistry::MarkFinalized(BatchId id, uint64_t total_salary,
                                  uint64_t total_bonus) {
  BatchProto batch = GetClosed(id);
  batch.set_finalized(true);
  batch.set_total_salary(total_salary);
  batch.set_total_bonus(total_bonus);
  Save(batch);
}

void BatchRegistry::Save(const BatchProto& batch) {
  std::string value;
  YACL_ENFORCE(batch.SerializeToString(&value));
  store_->Put(BatchKey(batch.id()), value);
}

}  // namespace confagg
