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

#include "confagg/oracle/decryption_oracle.h"

#include "yacl/base/exception.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

std::string EncodeCleartexts(const std::vector<uint64_t>& values) {
  DecryptionCleartexts proto;
  proto.mutable_values()->Assign(values.begin(), values.end());
  std::string out;
  YACL_ENFORCE(proto.SerializeToString(&out));
  return out;
}

std::vector<uint64_t> DecodeCleartexts(const std::string& cleartexts) {
  DecryptionCleartexts proto;
  YACL_ENFORCE(proto.ParseFromString(cleartexts),
               "cleartexts couldn't be parsed");
  return std::vector<uint64_t>(proto.values().begin(), proto.values().end());
}

}  // namespace confagg
