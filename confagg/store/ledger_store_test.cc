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

#include "confagg/store/ledger_store.h"

#include <filesystem>
#include <fstream>
#include <iterator>

#include "fmt/format.h"
#include "gtest/gtest.h"
#include "yacl/base/exception.h"

namespace confagg {

namespace {

std::filesystem::path TempLedgerPath(const std::string& name) {
  auto path = std::filesystem::temp_directory_path() /
              fmt::format("confagg_{}_{}.ledger", name,
                          ::testing::UnitTest::GetInstance()->random_seed());
  std::filesystem::remove(path);
  return path;
}

std::string ReadAll(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

void WriteAll(const std::filesystem::path& path, const std::string& data) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  out << data;
}

TEST(MemoryLedgerStoreTest, Works) {
  MemoryLedgerStore store;
  EXPECT_EQ(store.size(), 0);
  EXPECT_TRUE(store.head_digest().empty());
  EXPECT_FALSE(store.Get("k").has_value());

  store.Put("k", "v1");
  std::string head = store.head_digest();
  store.Put("other", "x");
  store.Put("k", "v2");

  EXPECT_EQ(store.size(), 3);
  EXPECT_EQ(store.Get("k").value(), "v2");
  EXPECT_TRUE(store.Has("other"));
  EXPECT_NE(store.head_digest(), head);
  EXPECT_TRUE(store.Verify());

  // history is kept
  EXPECT_EQ(store.entries()[0].value(), "v1");
  EXPECT_EQ(store.entries()[1].prev_digest(), head);
}

TEST(MemoryLedgerStoreTest, EmptyKey) {
  MemoryLedgerStore store;
  EXPECT_THROW(store.Put("", "v"), yacl::Exception);
}

TEST(MemoryLedgerStoreTest, DigestCoversEveryField) {
  LedgerEntry entry;
  entry.set_seq(3);
  entry.set_key("k");
  entry.set_value("v");
  entry.set_prev_digest("p");
  std::string digest = ComputeEntryDigest(entry);

  LedgerEntry changed = entry;
  changed.set_seq(4);
  EXPECT_NE(ComputeEntryDigest(changed), digest);
  changed = entry;
  changed.set_value("w");
  EXPECT_NE(ComputeEntryDigest(changed), digest);
  changed = entry;
  changed.set_key("kv");
  changed.set_value("");
  EXPECT_NE(ComputeEntryDigest(changed), digest);
}

TEST(FileLedgerStoreTest, Reopen) {
  auto path = TempLedgerPath("reopen");
  std::string head;
  {
    FileLedgerStore store(path);
    store.Put("batch/current", "1");
    store.Put("record/alice", "ciphertexts");
    store.Put("batch/current", "2");
    head = store.head_digest();
  }

  FileLedgerStore reopened(path);
  EXPECT_EQ(reopened.size(), 3);
  EXPECT_EQ(reopened.head_digest(), head);
  EXPECT_EQ(reopened.Get("batch/current").value(), "2");
  EXPECT_TRUE(reopened.Verify());

  reopened.Put("record/bob", "more");
  EXPECT_EQ(FileLedgerStore(path).Get("record/bob").value(), "more");

  std::filesystem::remove(path);
}

TEST(FileLedgerStoreTest, BinaryKeys) {
  auto path = TempLedgerPath("binary");
  const std::string key = std::string("record/\xff\xfe", 9);
  {
    FileLedgerStore store(path);
    store.Put(key, "1");
  }

  FileLedgerStore reopened(path);
  EXPECT_EQ(reopened.Get(key).value(), "1");
  EXPECT_TRUE(reopened.Verify());

  std::filesystem::remove(path);
}

TEST(FileLedgerStoreTest, DetectsTampering) {
  auto path = TempLedgerPath("tamper");
  {
    FileLedgerStore store(path);
    store.Put("record/alice", "salary=AAAA");
    store.Put("record/bob", "salary=BBBB");
  }

  std::string data = ReadAll(path);
  auto pos = data.find("AAAA");
  ASSERT_NE(pos, std::string::npos);
  data[pos] = 'Z';
  WriteAll(path, data);

  EXPECT_THROW(FileLedgerStore{path}, yacl::Exception);
  std::filesystem::remove(path);
}

TEST(FileLedgerStoreTest, DetectsTruncation) {
  auto path = TempLedgerPath("truncate");
  {
    FileLedgerStore store(path);
    store.Put("record/alice", "salary=AAAA");
    store.Put("record/bob", "salary=BBBB");
  }

  std::string data = ReadAll(path);
  WriteAll(path, data.substr(0, data.size() - 3));

  EXPECT_THROW(FileLedgerStore{path}, yacl::Exception);
  std::filesystem::remove(path);
}

}  // namespace

}  // namespace confagg
