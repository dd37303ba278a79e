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

#include "confagg/core/cooldown.h"

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "yacl/base/exception.h"

#include "confagg/core/errors.h"

namespace confagg {

namespace {

std::string CooldownKey(CooldownKind kind, const Identity& who) {
  switch (kind) {
    case CooldownKind::kSubmission:
      return absl::StrCat("cooldown/submit/", who);
    case CooldownKind::kDecryptionRequest:
      return absl::StrCat("cooldown/decrypt/", who);
  }
  YACL_THROW("unknown cooldown kind {}", static_cast<int>(kind));
}

}  // namespace

void CooldownTracker::Check(CooldownKind kind, const Identity& who,
                            uint64_t cooldown_seconds, int64_t now) const {
  auto last = Last(kind, who);
  if (!last.has_value()) {
    return;
  }
  int64_t ready_at = *last + static_cast<int64_t>(cooldown_seconds);
  if (now < ready_at) {
    CONFAGG_THROW(ErrorCode::kCooldownActive,
                  "{} must wait {} more seconds", who, ready_at - now);
  }
}

void CooldownTracker::Touch(CooldownKind kind, const Identity& who,
                            int64_t now) {
  store_->Put(CooldownKey(kind, who), absl::StrCat(now));
}

std::optional<int64_t> CooldownTracker::Last(CooldownKind kind,
                                             const Identity& who) const {
  auto value = store_->Get(CooldownKey(kind, who));
  if (!value.has_value()) {
    return std::nullopt;
  }
  int64_t ts = 0;
  YACL_ENFORCE(absl::SimpleAtoi(*value, &ts), "corrupted cooldown entry {}",
               *value);
  return ts;
}

}  // namespace confagg
