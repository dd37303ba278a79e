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

#include "confagg/proto/ledger.pb.h"

namespace confagg {

// Runs one complete round in process: fresh BFV keys, one batch holding every
// contribution of the config, one decryption request answered by a local
// oracle. Contributions are spread over the configured providers in turn and
// time is simulated, so submission cooldowns never stall the round.
//
// A non-empty store_path must not exist yet; keys are not persisted, so a
// store left by an earlier round could not be aggregated again.
AggregationReport RunAggregationRound(const LaunchConfig& launch_config);

}  // namespace confagg
