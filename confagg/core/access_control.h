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

#include <set>
#include <string>

#include "confagg/proto/ledger.pb.h"

namespace confagg {

using Identity = std::string;

// Role registry and pause switch. Passed explicitly into every ledger entry
// point instead of living in global state.
class AccessControl {
 public:
  AccessControl() = default;

  explicit AccessControl(const RoleConfig& roles);

  bool IsAdmin(const Identity& who) const { return admins_.count(who) > 0; }

  bool IsProvider(const Identity& who) const {
    return providers_.count(who) > 0;
  }

  bool IsOracle(const Identity& who) const {
    return !oracle_.empty() && who == oracle_;
  }

  bool IsPaused() const { return paused_; }

  // The following require `by` to be an admin and throw kNotAdmin otherwise.
  void GrantAdmin(const Identity& by, const Identity& who);
  void GrantProvider(const Identity& by, const Identity& who);
  void RevokeProvider(const Identity& by, const Identity& who);
  void SetOracle(const Identity& by, const Identity& who);
  void Pause(const Identity& by);
  void Unpause(const Identity& by);

  // Throw kNotAdmin / kNotProvider / kNotOracle / kPaused.
  void RequireAdmin(const Identity& who) const;
  void RequireProvider(const Identity& who) const;
  void RequireOracle(const Identity& who) const;
  void RequireNotPaused() const;

 private:
  std::set<Identity> admins_;
  std::set<Identity> providers_;
  Identity oracle_;
  bool paused_ = false;
};

}  // namespace confagg
