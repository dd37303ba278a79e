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

#include <array>
#include <utility>

#include "google/protobuf/io/zero_copy_stream_impl.h"
#include "google/protobuf/util/delimited_message_util.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"
#include "yacl/crypto/hash/blake3.h"

namespace confagg {

namespace {

void UpdateU64(yacl::crypto::Blake3Hash* hasher, uint64_t v) {
  std::array<uint8_t, sizeof(uint64_t)> buf;
  for (size_t i = 0; i < buf.size(); ++i) {
    buf[i] = static_cast<uint8_t>(v >> (8 * i));
  }
  hasher->Update(yacl::ByteContainerView(buf.data(), buf.size()));
}

void UpdateBytes(yacl::crypto::Blake3Hash* hasher, const std::string& bytes) {
  UpdateU64(hasher, bytes.size());
  hasher->Update(bytes);
}

}  // namespace

std::string ComputeEntryDigest(const LedgerEntry& entry) {
  yacl::crypto::Blake3Hash hasher;
  UpdateBytes(&hasher, entry.prev_digest());
  UpdateU64(&hasher, entry.seq());
  UpdateBytes(&hasher, entry.key());
  UpdateBytes(&hasher, entry.value());
  std::vector<uint8_t> digest = hasher.CumulativeHash();
  return std::string(digest.begin(), digest.end());
}

void MemoryLedgerStore::Put(const std::string& key, const std::string& value) {
  YACL_ENFORCE(!key.empty(), "ledger key must not be empty");
  LedgerEntry entry = MakeEntry(key, value);
  OnAppend(entry);
  Index(std::move(entry));
}

std::optional<std::string> MemoryLedgerStore::Get(
    const std::string& key) const {
  auto iter = latest_.find(key);
  if (iter == latest_.end()) {
    return std::nullopt;
  }
  return entries_[iter->second].value();
}

bool MemoryLedgerStore::Verify() const {
  std::string prev;
  for (size_t i = 0; i < entries_.size(); ++i) {
    const auto& entry = entries_[i];
    if (entry.seq() != i || entry.prev_digest() != prev ||
        ComputeEntryDigest(entry) != entry.digest()) {
      SPDLOG_ERROR("ledger chain broken at entry {}", i);
      return false;
    }
    prev = entry.digest();
  }
  return true;
}

std::string MemoryLedgerStore::head_digest() const {
  return entries_.empty() ? std::string() : entries_.back().digest();
}

void MemoryLedgerStore::Replay(const LedgerEntry& entry) {
  YACL_ENFORCE_EQ(entry.seq(), entries_.size(),
                  "ledger entry out of sequence");
  YACL_ENFORCE(entry.prev_digest() == head_digest(),
               "ledger entry {} doesn't chain to its predecessor",
               entry.seq());
  YACL_ENFORCE(ComputeEntryDigest(entry) == entry.digest(),
               "ledger entry {} digest mismatch", entry.seq());
  Index(entry);
}

LedgerEntry MemoryLedgerStore::MakeEntry(const std::string& key,
                                         const std::string& value) const {
  LedgerEntry entry;
  entry.set_seq(entries_.size());
  entry.set_key(key);
  entry.set_value(value);
  entry.set_prev_digest(head_digest());
  entry.set_digest(ComputeEntryDigest(entry));
  return entry;
}

void MemoryLedgerStore::Index(LedgerEntry entry) {
  latest_[entry.key()] = entries_.size();
  entries_.push_back(std::move(entry));
}

FileLedgerStore::FileLedgerStore(const std::filesystem::path& path)
    : path_(path) {
  if (std::filesystem::exists(path_)) {
    Load();
  } else if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }

  out_.open(path_, std::ios::out | std::ios::binary | std::ios::app);
  YACL_ENFORCE(out_.is_open(), "couldn't open ledger file {}",
               path_.string());
  SPDLOG_INFO("ledger file {} opened with {} entries", path_.string(),
              size());
}

FileLedgerStore::~FileLedgerStore() {
  if (out_.is_open()) {
    out_.close();
  }
}

void FileLedgerStore::OnAppend(const LedgerEntry& entry) {
  YACL_ENFORCE(
      google::protobuf::util::SerializeDelimitedToOstream(entry, &out_),
      "failed to append ledger entry {}", entry.seq());
  out_.flush();
  YACL_ENFORCE(out_.good(), "failed to flush ledger file {}", path_.string());
}

void FileLedgerStore::Load() {
  std::ifstream in(path_, std::ios::in | std::ios::binary);
  YACL_ENFORCE(in.is_open(), "couldn't read ledger file {}", path_.string());

  google::protobuf::io::IstreamInputStream input(&in);
  while (true) {
    LedgerEntry entry;
    bool clean_eof = false;
    if (!google::protobuf::util::ParseDelimitedFromZeroCopyStream(
            &entry, &input, &clean_eof)) {
      YACL_ENFORCE(clean_eof, "ledger file {} is truncated after entry {}",
                   path_.string(), size());
      break;
    }
    Replay(entry);
  }
}

}  // namespace confagg
