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

#include <memory>
#include <vector>

#include "absl/strings/str_cat.h"
#include "gtest/gtest.h"
#include "yacl/base/exception.h"

#include "confagg/utils/test_utils.h"

namespace confagg {

namespace {

TEST(BatchRegistryTest, Lifecycle) {
  BatchRegistry batches(std::make_shared<MemoryLedgerStore>());
  EXPECT_EQ(batches.current_id(), 0);
  EXPECT_FALSE(batches.IsCurrentOpen());
  EXPECT_PROTOCOL_ERROR(batches.Close(), ErrorCode::kInvalidBatchState);

  auto opened = batches.Open();
  EXPECT_EQ(opened.opened, 1);
  EXPECT_FALSE(opened.closed.has_value());
  EXPECT_TRUE(batches.IsCurrentOpen());
  EXPECT_EQ(batches.Get(1)->state(), BatchProto::STATE_OPEN);

  EXPECT_EQ(batches.Close(), 1);
  EXPECT_FALSE(batches.IsCurrentOpen());
  EXPECT_EQ(batches.Get(1)->state(), BatchProto::STATE_CLOSED);
  EXPECT_PROTOCOL_ERROR(batches.Close(), ErrorCode::kInvalidBatchState);
}

TEST(BatchRegistryTest, IdsIncreaseByOne) {
  BatchRegistry batches(std::make_shared<MemoryLedgerStore>());
  for (BatchId expected = 1; expected <= 5; ++expected) {
    EXPECT_EQ(batches.Open().opened, expected);
    batches.Close();
  }
  EXPECT_EQ(batches.current_id(), 5);
}

TEST(BatchRegistryTest, OpenClosesPrevious) {
  BatchRegistry batches(std::make_shared<MemoryLedgerStore>());
  batches.Open();

  auto second = batches.Open();
  EXPECT_EQ(second.opened, 2);
  ASSERT_TRUE(second.closed.has_value());
  EXPECT_EQ(*second.closed, 1);
  EXPECT_EQ(batches.Get(1)->state(), BatchProto::STATE_CLOSED);
  EXPECT_EQ(batches.Get(2)->state(), BatchProto::STATE_OPEN);
}

TEST(BatchRegistryTest, Contributors) {
  BatchRegistry batches(std::make_shared<MemoryLedgerStore>());
  BatchId id = batches.Open().opened;

  batches.AddContributor(id, "bob");
  batches.AddContributor(id, "alice");
  EXPECT_TRUE(batches.HasContributed(id, "bob"));
  EXPECT_FALSE(batches.HasContributed(id, "carol"));
  EXPECT_THROW(batches.AddContributor(id, "bob"), yacl::Exception);

  EXPECT_EQ(batches.Get(id)->contributor_count(), 2);
  // insertion order
  EXPECT_EQ(batches.Contributors(id),
            (std::vector<Identity>{"bob", "alice"}));
  EXPECT_TRUE(batches.Contributors(id + 1).empty());

  batches.Close();
  EXPECT_THROW(batches.AddContributor(id, "carol"), yacl::Exception);
  EXPECT_FALSE(batches.HasContributed(id + 1, "bob"));
}

TEST(BatchRegistryTest, MembershipWritesDoNotGrowWithBatch) {
  auto store = std::make_shared<MemoryLedgerStore>();
  BatchRegistry batches(store);
  BatchId id = batches.Open().opened;

  batches.AddContributor(id, "m0");
  size_t before = store->size();
  batches.AddContributor(id, "m1");
  size_t per_member = store->size() - before;
  size_t batch_bytes = store->Get(absl::StrCat("batch/", id))->size();

  for (int i = 2; i < 200; ++i) {
    before = store->size();
    batches.AddContributor(id, absl::StrCat("m", i));
    EXPECT_EQ(store->size() - before, per_member);
  }
  EXPECT_LE(store->Get(absl::StrCat("batch/", id))->size(), batch_bytes + 1);
  EXPECT_EQ(batches.Contributors(id).size(), 200);
}

TEST(BatchRegistryTest, BinaryIdentities) {
  auto store = std::make_shared<MemoryLedgerStore>();
  const Identity binary("\xff\xfe", 2);
  {
    BatchRegistry batches(store);
    batches.Open();
    batches.AddContributor(1, binary);
  }

  BatchRegistry batches(store);
  EXPECT_TRUE(batches.IsCurrentOpen());
  EXPECT_TRUE(batches.HasContributed(1, binary));
  EXPECT_EQ(batches.Contributors(1), std::vector<Identity>{binary});
  EXPECT_EQ(batches.Close(), 1);
}

TEST(BatchRegistryTest, GetClosed) {
  BatchRegistry batches(std::make_shared<MemoryLedgerStore>());
  EXPECT_PROTOCOL_ERROR(batches.GetClosed(1), ErrorCode::kInvalidBatch);

  BatchId id = batches.Open().opened;
  EXPECT_PROTOCOL_ERROR(batches.GetClosed(id), ErrorCode::kInvalidBatch);

  batches.Close();
  EXPECT_EQ(batches.GetClosed(id).id(), id);

  batches.MarkFinalized(id, 3000, 180000);
  auto batch = batches.Get(id);
  EXPECT_TRUE(batch->finalized());
  EXPECT_EQ(batch->total_salary(), 3000);
  EXPECT_EQ(batch->total_bonus(), 180000);
}

TEST(BatchRegistryTest, SurvivesReopen) {
  auto store = std::make_shared<MemoryLedgerStore>();
  {
    BatchRegistry batches(store);
    batches.Open();
    batches.AddContributor(1, "alice");
  }

  BatchRegistry batches(store);
  EXPECT_EQ(batches.current_id(), 1);
  EXPECT_TRUE(batches.IsCurrentOpen());
  EXPECT_TRUE(batches.HasContributed(1, "alice"));
}

}  // namespace

}  // namespace confagg
