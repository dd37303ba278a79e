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

#include "confagg/crypto/seal_bfv.h"

#include <utility>

#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"

namespace confagg {

namespace {
constexpr size_t kFreshCiphertextSize = 2;
}  // namespace

SealBfvContext::SealBfvContext(const BfvParams& params) {
  size_t poly_modulus_degree = params.poly_modulus_degree() == 0
                                   ? kDefaultPolyModulusDegree
                                   : params.poly_modulus_degree();
  int plain_modulus_bits = params.plain_modulus_bits() == 0
                               ? kDefaultPlainModulusBits
                               : params.plain_modulus_bits();

  // one multiplicative level needs at least 4096
  YACL_ENFORCE_GE(poly_modulus_degree, (size_t)4096);
  YACL_ENFORCE(plain_modulus_bits >= 17 && plain_modulus_bits <= 60,
               "plain_modulus_bits should be in [17, 60], got {}",
               plain_modulus_bits);

  enc_params_ =
      std::make_unique<seal::EncryptionParameters>(seal::scheme_type::bfv);
  enc_params_->set_poly_modulus_degree(poly_modulus_degree);
  enc_params_->set_coeff_modulus(
      seal::CoeffModulus::BFVDefault(poly_modulus_degree));
  enc_params_->set_plain_modulus(
      seal::PlainModulus::Batching(poly_modulus_degree, plain_modulus_bits));

  context_ = std::make_unique<seal::SEALContext>(*enc_params_);
  YACL_ENFORCE(context_->parameters_set(), "invalid BFV parameters: {}",
               context_->parameter_error_message());
  YACL_ENFORCE(context_->using_keyswitching(),
               "SEAL parameters do not support key switching.");

  SPDLOG_INFO("BFV context ready, poly degree: {}, plain modulus: {}",
              poly_modulus_degree, plain_modulus());
}

SealBfvKeys SealBfvKeys::Generate(const SealBfvContext& ctx) {
  seal::KeyGenerator keygen(ctx.context());

  SealBfvKeys keys;
  keys.secret_key = keygen.secret_key();
  keygen.create_public_key(keys.public_key);
  keygen.create_relin_keys(keys.relin_keys);
  return keys;
}

SealBfvEvaluator::SealBfvEvaluator(std::shared_ptr<const SealBfvContext> ctx,
                                   const seal::PublicKey& public_key,
                                   seal::RelinKeys relin_keys)
    : ctx_(std::move(ctx)), relin_keys_(std::move(relin_keys)) {
  YACL_ENFORCE(ctx_ != nullptr);
  evaluator_ = std::make_unique<seal::Evaluator>(ctx_->context());

  SealBfvEncryptor encryptor(ctx_, public_key);
  zero_ = encryptor.Encrypt(0);
}

bool SealBfvEvaluator::IsInitialized(const Ciphertext& ct) const {
  if (!ct.IsInitialized()) {
    return false;
  }
  try {
    seal::Ciphertext loaded =
        ctx_->DeSerializeSealObject<seal::Ciphertext>(ct.bytes());
    // Fresh encryptions only: two polynomials at the top data level.
    // Anything else would break relinearization or level-matched addition.
    if (loaded.size() != kFreshCiphertextSize ||
        loaded.parms_id() != ctx_->context().first_parms_id()) {
      SPDLOG_DEBUG("ciphertext {} has size {} and is not fresh", ct.Handle(),
                   loaded.size());
      return false;
    }
    return true;
  } catch (const std::exception& ex) {
    SPDLOG_DEBUG("ciphertext {} does not load: {}", ct.Handle(), ex.what());
    return false;
  }
}

Ciphertext SealBfvEvaluator::Add(const Ciphertext& a,
                                 const Ciphertext& b) const {
  seal::Ciphertext result;
  evaluator_->add(Load(a), Load(b), result);
  return Store(result);
}

Ciphertext SealBfvEvaluator::Multiply(const Ciphertext& a,
                                      const Ciphertext& b) const {
  seal::Ciphertext result;
  evaluator_->multiply(Load(a), Load(b), result);
  evaluator_->relinearize_inplace(result, relin_keys_);
  return Store(result);
}

seal::Ciphertext SealBfvEvaluator::Load(const Ciphertext& ct) const {
  YACL_ENFORCE(ct.IsInitialized(),
               "homomorphic operation on an uninitialized ciphertext");
  return ctx_->DeSerializeSealObject<seal::Ciphertext>(ct.bytes());
}

Ciphertext SealBfvEvaluator::Store(const seal::Ciphertext& ct) const {
  return Ciphertext(ctx_->SerializeSealObject(ct));
}

SealBfvEncryptor::SealBfvEncryptor(std::shared_ptr<const SealBfvContext> ctx,
                                   const seal::PublicKey& public_key)
    : ctx_(std::move(ctx)) {
  YACL_ENFORCE(ctx_ != nullptr);
  encryptor_ = std::make_unique<seal::Encryptor>(ctx_->context(), public_key);
}

Ciphertext SealBfvEncryptor::Encrypt(uint64_t value) const {
  YACL_ENFORCE_LT(value, ctx_->plain_modulus(),
                  "value does not fit the plain modulus");

  seal::Plaintext plain(1);
  plain[0] = value;

  seal::Ciphertext cipher;
  encryptor_->encrypt(plain, cipher);
  return Ciphertext(ctx_->SerializeSealObject(cipher));
}

SealBfvDecryptor::SealBfvDecryptor(std::shared_ptr<const SealBfvContext> ctx,
                                   const seal::SecretKey& secret_key)
    : ctx_(std::move(ctx)) {
  YACL_ENFORCE(ctx_ != nullptr);
  decryptor_ = std::make_unique<seal::Decryptor>(ctx_->context(), secret_key);
}

uint64_t SealBfvDecryptor::Decrypt(const Ciphertext& ct) const {
  YACL_ENFORCE(ct.IsInitialized(), "cannot decrypt an uninitialized value");
  seal::Ciphertext cipher =
      ctx_->DeSerializeSealObject<seal::Ciphertext>(ct.bytes());

  YACL_ENFORCE_GT(decryptor_->invariant_noise_budget(cipher), 0,
                  "noise budget exhausted for ciphertext {}", ct.Handle());

  seal::Plaintext plain;
  decryptor_->decrypt(cipher, plain);
  return plain.coeff_count() == 0 ? 0 : plain[0];
}

}  // namespace confagg
