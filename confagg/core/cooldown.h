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

#include <cstdint>
#include <memory>
#include <optional>

#include "confagg/core/access_control.h"
#include "confagg/store/ledger_store.h"

namespace confagg {

enum class CooldownKind {
  kSubmission,
  kDecryptionRequest,
};

// Per-identity rate limit. A gated call fails (never waits) while
// now < last + cooldown.
class CooldownTracker {
 public:
  explicit CooldownTracker(std::shared_ptr<ILedgerStore> store)
      : store_(std::move(store)) {}

  // Throws kCooldownActive.
  void Check(CooldownKind kind, const Identity& who, uint64_t cooldown_seconds,
             int64_t now) const;

  void Touch(CooldownKind kind, const Identity& who, int64_t now);

  std::optional<int64_t> Last(CooldownKind kind, const Identity& who) const;

 private:
  std::shared_ptr<ILedgerStore> store_;
};

}  // namespace confagg
