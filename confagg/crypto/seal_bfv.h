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

#include <cstdint>
#include <memory>
#include <sstream>
#include <string>

#include "seal/seal.h"

#include "confagg/crypto/he_evaluator.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

inline constexpr uint32_t kDefaultPolyModulusDegree = 8192;
inline constexpr uint32_t kDefaultPlainModulusBits = 40;

// BFV encryption parameters shared by the evaluator, the providers'
// encryptors and the oracle's decryptor. Integers are encoded as constant
// polynomials, so add and multiply act on them modulo the plain modulus.
class SealBfvContext {
 public:
  explicit SealBfvContext(const BfvParams& params);

  const seal::SEALContext& context() const { return *context_; }

  uint64_t plain_modulus() const {
    return enc_params_->plain_modulus().value();
  }

  size_t poly_modulus_degree() const {
    return enc_params_->poly_modulus_degree();
  }

  // Uncompressed, so equal objects always serialize to equal bytes.
  template <typename T>
  std::string SerializeSealObject(const T& object) const {
    std::ostringstream output;
    object.save(output, seal::compr_mode_type::none);
    return output.str();
  }

  template <typename T>
  T DeSerializeSealObject(const std::string& object_bytes) const {
    T seal_object;
    std::istringstream object_input(object_bytes);
    seal_object.load(*context_, object_input);
    return seal_object;
  }

 private:
  std::unique_ptr<seal::EncryptionParameters> enc_params_;
  std::unique_ptr<seal::SEALContext> context_;
};

struct SealBfvKeys {
  seal::PublicKey public_key;
  seal::RelinKeys relin_keys;
  seal::SecretKey secret_key;

  static SealBfvKeys Generate(const SealBfvContext& ctx);
};

class SealBfvEvaluator : public IHomomorphicEvaluator {
 public:
  SealBfvEvaluator(std::shared_ptr<const SealBfvContext> ctx,
                   const seal::PublicKey& public_key,
                   seal::RelinKeys relin_keys);

  Ciphertext EncryptZero() const override { return zero_; }

  bool IsInitialized(const Ciphertext& ct) const override;

  Ciphertext Add(const Ciphertext& a, const Ciphertext& b) const override;

  Ciphertext Multiply(const Ciphertext& a, const Ciphertext& b) const override;

 private:
  seal::Ciphertext Load(const Ciphertext& ct) const;

  Ciphertext Store(const seal::Ciphertext& ct) const;

  std::shared_ptr<const SealBfvContext> ctx_;
  seal::RelinKeys relin_keys_;
  std::unique_ptr<seal::Evaluator> evaluator_;
  Ciphertext zero_;
};

// Provider side.
class SealBfvEncryptor {
 public:
  SealBfvEncryptor(std::shared_ptr<const SealBfvContext> ctx,
                   const seal::PublicKey& public_key);

  Ciphertext Encrypt(uint64_t value) const;

 private:
  std::shared_ptr<const SealBfvContext> ctx_;
  std::unique_ptr<seal::Encryptor> encryptor_;
};

// Key holder side. Only the decryption oracle owns one of these.
class SealBfvDecryptor {
 public:
  SealBfvDecryptor(std::shared_ptr<const SealBfvContext> ctx,
                   const seal::SecretKey& secret_key);

  uint64_t Decrypt(const Ciphertext& ct) const;

 private:
  std::shared_ptr<const SealBfvContext> ctx_;
  std::unique_ptr<seal::Decryptor> decryptor_;
};

}  // namespace confagg
