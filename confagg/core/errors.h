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

#include <string>
#include <utility>

#include "fmt/format.h"
#include "yacl/base/exception.h"

namespace confagg {

enum class ErrorCategory {
  kAuthorization,
  kLifecycle,
  kRateLimit,
  kDuplicate,
  kReplay,
  kConsistency,
  kProof,
};

enum class ErrorCode {
  kNotAdmin,
  kNotProvider,
  kNotOracle,
  kPaused,
  kInvalidBatchState,
  kInvalidBatch,
  kUnknownRequest,
  kRequestExpired,
  kCooldownActive,
  kDuplicateContribution,
  kReplayAttempt,
  kStateMismatch,
  kProofVerificationFailed,
};

ErrorCategory CategoryOf(ErrorCode code);

std::string ErrorCodeName(ErrorCode code);

std::string ErrorCategoryName(ErrorCategory category);

// Raised when a ledger entry point rejects a call. No state has been written
// when this is thrown.
class ProtocolError : public yacl::Exception {
 public:
  ProtocolError(ErrorCode code, const std::string& msg)
      : yacl::Exception(fmt::format("[{}] {}", ErrorCodeName(code), msg)),
        code_(code) {}

  ErrorCode code() const { return code_; }

  ErrorCategory category() const { return CategoryOf(code_); }

 private:
  ErrorCode code_;
};

}  // namespace confagg

#define CONFAGG_THROW(code, ...) \
  throw ::confagg::ProtocolError((code), fmt::format(__VA_ARGS__))
