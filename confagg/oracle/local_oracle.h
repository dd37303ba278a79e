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

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "confagg/crypto/schnorr.h"
#include "confagg/crypto/seal_bfv.h"
#include "confagg/oracle/decryption_oracle.h"

namespace confagg {

// In-process decryption oracle holding the BFV secret key. Requests are
// queued and answered only when Fulfill is called, which lets callers model
// the asynchronous round trip (and the case where it never completes).
class LocalDecryptionOracle : public IDecryptionOracle {
 public:
  LocalDecryptionOracle(std::shared_ptr<const SealBfvContext> ctx,
                        const seal::SecretKey& secret_key, std::string domain,
                        std::shared_ptr<yacl::crypto::EcGroup> curve =
                            CreateSignatureCurve());

  RequestId RequestDecryption(
      const std::vector<Ciphertext>& ciphertexts) override;

  bool VerifyProof(RequestId request_id, const std::string& cleartexts,
                   const std::string& proof) const override;

  // Decrypts a pending request and signs the result. The request leaves the
  // pending queue; fulfilling it twice throws.
  DecryptionResponse Fulfill(RequestId request_id);

  std::vector<RequestId> PendingRequests() const;

  const yacl::crypto::EcPoint& public_key() const {
    return signer_.public_key();
  }

 private:
  std::string ProofMessage(RequestId request_id,
                           const std::string& cleartexts) const;

  mutable std::mutex mutex_;

  SealBfvDecryptor decryptor_;

  SchnorrSigner signer_;

  SchnorrVerifier verifier_;

  std::string domain_;

  RequestId next_request_id_ = 1;

  std::map<RequestId, std::vector<Ciphertext>> pending_;
};

}  // namespace confagg
