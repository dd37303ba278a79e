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

#include "confagg/crypto/ciphertext.h"

#include "absl/strings/escaping.h"
#include "absl/strings/string_view.h"
#include "yacl/base/exception.h"
#include "yacl/crypto/hash/hash_utils.h"

namespace confagg {

namespace {
constexpr size_t kHandleBytes = 16;
}  // namespace

const std::string& Ciphertext::bytes() const {
  YACL_ENFORCE(value_.has_value(), "ciphertext is not initialized");
  return *value_;
}

std::string Ciphertext::Handle() const {
  if (!value_.has_value()) {
    return "uninitialized";
  }
  auto digest = yacl::crypto::Sha256(*value_);
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char*>(digest.data()), kHandleBytes));
}

CiphertextProto Ciphertext::ToProto() const {
  CiphertextProto proto;
  proto.set_initialized(value_.has_value());
  if (value_.has_value()) {
    proto.set_data(*value_);
  }
  return proto;
}

Ciphertext Ciphertext::FromProto(const CiphertextProto& proto) {
  if (!proto.initialized()) {
    return Ciphertext();
  }
  return Ciphertext(proto.data());
}

}  // namespace confagg
