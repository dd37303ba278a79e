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

#include "confagg/core/errors.h"

namespace confagg {

ErrorCategory CategoryOf(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNotAdmin:
    case ErrorCode::kNotProvider:
    case ErrorCode::kNotOracle:
    case ErrorCode::kPaused:
      return ErrorCategory::kAuthorization;
    case ErrorCode::kInvalidBatchState:
    case ErrorCode::kInvalidBatch:
    case ErrorCode::kUnknownRequest:
    case ErrorCode::kRequestExpired:
      return ErrorCategory::kLifecycle;
    case ErrorCode::kCooldownActive:
      return ErrorCategory::kRateLimit;
    case ErrorCode::kDuplicateContribution:
      return ErrorCategory::kDuplicate;
    case ErrorCode::kReplayAttempt:
      return ErrorCategory::kReplay;
    case ErrorCode::kStateMismatch:
      return ErrorCategory::kConsistency;
    case ErrorCode::kProofVerificationFailed:
      return ErrorCategory::kProof;
  }
  YACL_THROW("unknown error code {}", static_cast<int>(code));
}

std::string ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kNotAdmin:
      return "NotAdmin";
    case ErrorCode::kNotProvider:
      return "NotProvider";
    case ErrorCode::kNotOracle:
      return "NotOracle";
    case ErrorCode::kPaused:
      return "Paused";
    case ErrorCode::kInvalidBatchState:
      return "InvalidBatchState";
    case ErrorCode::kInvalidBatch:
      return "InvalidBatch";
    case ErrorCode::kUnknownRequest:
      return "UnknownRequest";
    case ErrorCode::kRequestExpired:
      return "RequestExpired";
    case ErrorCode::kCooldownActive:
      return "CooldownActive";
    case ErrorCode::kDuplicateContribution:
      return "DuplicateContribution";
    case ErrorCode::kReplayAttempt:
      return "ReplayAttempt";
    case ErrorCode::kStateMismatch:
      return "StateMismatch";
    case ErrorCode::kProofVerificationFailed:
      return "ProofVerificationFailed";
  }
  YACL_THROW("unknown error code {}", static_cast<int>(code));
}

std::string ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kAuthorization:
      return "AuthorizationError";
    case ErrorCategory::kLifecycle:
      return "LifecycleError";
    case ErrorCategory::kRateLimit:
      return "RateLimitError";
    case ErrorCategory::kDuplicate:
      return "DuplicateError";
    case ErrorCategory::kReplay:
      return "ReplayError";
    case ErrorCategory::kConsistency:
      return "ConsistencyError";
    case ErrorCategory::kProof:
      return "ProofError";
  }
  YACL_THROW("unknown error category {}", static_cast<int>(category));
}

}  // namespace confagg
