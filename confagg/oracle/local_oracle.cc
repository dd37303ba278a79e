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

#include "confagg/oracle/local_oracle.h"

#include <utility>

#include "fmt/format.h"
#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

namespace confagg {

LocalDecryptionOracle::LocalDecryptionOracle(
    std::shared_ptr<const SealBfvContext> ctx,
    const seal::SecretKey& secret_key, std::string domain,
    std::shared_ptr<yacl::crypto::EcGroup> curve)
    : decryptor_(std::move(ctx), secret_key),
      signer_(std::move(curve)),
      verifier_(signer_.curve(), signer_.public_key()),
      domain_(std::move(domain)) {
  YACL_ENFORCE(!domain_.empty(), "oracle domain must not be empty");
}

RequestId LocalDecryptionOracle::RequestDecryption(
    const std::vector<Ciphertext>& ciphertexts) {
  YACL_ENFORCE(!ciphertexts.empty(), "nothing to decrypt");
  for (const auto& ct : ciphertexts) {
    YACL_ENFORCE(ct.IsInitialized(), "cannot decrypt an uninitialized value");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  RequestId request_id = next_request_id_++;
  pending_.emplace(request_id, ciphertexts);
  SPDLOG_INFO("oracle queued decryption request {} with {} ciphertexts",
              request_id, ciphertexts.size());
  return request_id;
}

DecryptionResponse LocalDecryptionOracle::Fulfill(RequestId request_id) {
  std::vector<Ciphertext> ciphertexts;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = pending_.find(request_id);
    YACL_ENFORCE(iter != pending_.end(), "request {} is not pending",
                 request_id);
    ciphertexts = std::move(iter->second);
    pending_.erase(iter);
  }

  std::vector<uint64_t> values;
  values.reserve(ciphertexts.size());
  for (const auto& ct : ciphertexts) {
    values.push_back(decryptor_.Decrypt(ct));
  }

  DecryptionResponse response;
  response.request_id = request_id;
  response.cleartexts = EncodeCleartexts(values);
  response.proof = signer_.Sign(ProofMessage(request_id, response.cleartexts));
  SPDLOG_INFO("oracle fulfilled decryption request {}", request_id);
  return response;
}

bool LocalDecryptionOracle::VerifyProof(RequestId request_id,
                                        const std::string& cleartexts,
                                        const std::string& proof) const {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (request_id == 0 || request_id >= next_request_id_) {
      SPDLOG_WARN("request {} was never issued by this oracle", request_id);
      return false;
    }
  }
  return verifier_.Verify(ProofMessage(request_id, cleartexts), proof);
}

std::vector<RequestId> LocalDecryptionOracle::PendingRequests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<RequestId> ret;
  ret.reserve(pending_.size());
  for (const auto& [request_id, _] : pending_) {
    ret.push_back(request_id);
  }
  return ret;
}

std::string LocalDecryptionOracle::ProofMessage(
    RequestId request_id, const std::string& cleartexts) const {
  return fmt::format("{}|{}|", domain_, request_id) + cleartexts;
}

}  // namespace confagg
