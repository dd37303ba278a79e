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

#include "confagg/core/access_control.h"

#include "spdlog/spdlog.h"

#include "confagg/core/errors.h"

namespace confagg {

AccessControl::AccessControl(const RoleConfig& roles)
    : admins_(roles.admins().begin(), roles.admins().end()),
      providers_(roles.providers().begin(), roles.providers().end()),
      oracle_(roles.oracle()) {}

void AccessControl::GrantAdmin(const Identity& by, const Identity& who) {
  RequireAdmin(by);
  admins_.insert(who);
}

void AccessControl::GrantProvider(const Identity& by, const Identity& who) {
  RequireAdmin(by);
  providers_.insert(who);
  SPDLOG_INFO("{} granted provider role to {}", by, who);
}

void AccessControl::RevokeProvider(const Identity& by, const Identity& who) {
  RequireAdmin(by);
  providers_.erase(who);
  SPDLOG_INFO("{} revoked provider role of {}", by, who);
}

void AccessControl::SetOracle(const Identity& by, const Identity& who) {
  RequireAdmin(by);
  oracle_ = who;
}

void AccessControl::Pause(const Identity& by) {
  RequireAdmin(by);
  paused_ = true;
}

void AccessControl::Unpause(const Identity& by) {
  RequireAdmin(by);
  paused_ = false;
}

void AccessControl::RequireAdmin(const Identity& who) const {
  if (!IsAdmin(who)) {
    CONFAGG_THROW(ErrorCode::kNotAdmin, "{} is not an admin", who);
  }
}

void AccessControl::RequireProvider(const Identity& who) const {
  if (!IsProvider(who)) {
    CONFAGG_THROW(ErrorCode::kNotProvider, "{} is not a provider", who);
  }
}

void AccessControl::RequireOracle(const Identity& who) const {
  if (!IsOracle(who)) {
    CONFAGG_THROW(ErrorCode::kNotOracle, "{} is not the decryption oracle",
                  who);
  }
}

void AccessControl::RequireNotPaused() const {
  if (paused_) {
    CONFAGG_THROW(ErrorCode::kPaused, "ledger is paused");
  }
}

}  // namespace confagg
