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

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "confagg/proto/ledger.pb.h"

namespace confagg {

// Append-only, tamper-evident key-value store. Every Put appends an entry
// chained to its predecessor by digest; Get returns the latest value.
class ILedgerStore {
 public:
  virtual ~ILedgerStore() = default;

  virtual void Put(const std::string& key, const std::string& value) = 0;

  virtual std::optional<std::string> Get(const std::string& key) const = 0;

  bool Has(const std::string& key) const { return Get(key).has_value(); }

  // Recomputes the digest chain over every entry.
  virtual bool Verify() const = 0;

  // Number of appended entries.
  virtual size_t size() const = 0;

  // Digest of the last entry, empty for an empty store.
  virtual std::string head_digest() const = 0;
};

// digest = Blake3(prev_digest || seq || key || value), length-prefixed.
std::string ComputeEntryDigest(const LedgerEntry& entry);

class MemoryLedgerStore : public ILedgerStore {
 public:
  MemoryLedgerStore() = default;

  void Put(const std::string& key, const std::string& value) override;

  std::optional<std::string> Get(const std::string& key) const override;

  bool Verify() const override;

  size_t size() const override { return entries_.size(); }

  std::string head_digest() const override;

  const std::vector<LedgerEntry>& entries() const { return entries_; }

 protected:
  // Called after an entry is chained, before it becomes visible.
  virtual void OnAppend(const LedgerEntry& /*entry*/) {}

  // Re-adds an entry that was persisted earlier. Throws if it doesn't chain.
  void Replay(const LedgerEntry& entry);

 private:
  LedgerEntry MakeEntry(const std::string& key, const std::string& value) const;

  void Index(LedgerEntry entry);

  std::vector<LedgerEntry> entries_;

  // key -> position in entries_ of its latest value
  std::unordered_map<std::string, size_t> latest_;
};

// Entries are written to a file as length-delimited LedgerEntry messages and
// replayed (and verified) when the store is opened.
class FileLedgerStore : public MemoryLedgerStore {
 public:
  explicit FileLedgerStore(const std::filesystem::path& path);

  ~FileLedgerStore() override;

  std::filesystem::path path() const { return path_; }

 protected:
  void OnAppend(const LedgerEntry& entry) override;

 private:
  void Load();

  std::filesystem::path path_;

  std::ofstream out_;
};

}  // namespace confagg
