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

#include <memory>

#include "gtest/gtest.h"
#include "yacl/base/exception.h"

namespace confagg {

namespace {

class SealBfvTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = std::make_shared<SealBfvContext>(BfvParams());
    keys_ = SealBfvKeys::Generate(*ctx_);
    evaluator_ = std::make_unique<SealBfvEvaluator>(ctx_, keys_.public_key,
                                                    keys_.relin_keys);
    encryptor_ = std::make_unique<SealBfvEncryptor>(ctx_, keys_.public_key);
    decryptor_ = std::make_unique<SealBfvDecryptor>(ctx_, keys_.secret_key);
  }

  std::shared_ptr<SealBfvContext> ctx_;
  SealBfvKeys keys_;
  std::unique_ptr<SealBfvEvaluator> evaluator_;
  std::unique_ptr<SealBfvEncryptor> encryptor_;
  std::unique_ptr<SealBfvDecryptor> decryptor_;
};

TEST_F(SealBfvTest, DefaultParams) {
  EXPECT_EQ(ctx_->poly_modulus_degree(), kDefaultPolyModulusDegree);
  EXPECT_GT(ctx_->plain_modulus(), 1ULL << (kDefaultPlainModulusBits - 1));
  EXPECT_LT(ctx_->plain_modulus(), 1ULL << kDefaultPlainModulusBits);
}

TEST_F(SealBfvTest, RejectsBadParams) {
  BfvParams small_degree;
  small_degree.set_poly_modulus_degree(2048);
  EXPECT_THROW(SealBfvContext{small_degree}, yacl::Exception);

  BfvParams wide_plain;
  wide_plain.set_plain_modulus_bits(61);
  EXPECT_THROW(SealBfvContext{wide_plain}, yacl::Exception);
}

TEST_F(SealBfvTest, EncryptDecrypt) {
  for (uint64_t value : {0ULL, 1ULL, 1000ULL, 123456789ULL}) {
    EXPECT_EQ(decryptor_->Decrypt(encryptor_->Encrypt(value)), value);
  }
  EXPECT_THROW(encryptor_->Encrypt(ctx_->plain_modulus()), yacl::Exception);
}

TEST_F(SealBfvTest, AddAndMultiply) {
  Ciphertext salary = encryptor_->Encrypt(2000);
  Ciphertext score = encryptor_->Encrypt(50);

  EXPECT_EQ(decryptor_->Decrypt(evaluator_->Add(salary, score)), 2050);
  EXPECT_EQ(decryptor_->Decrypt(evaluator_->Multiply(salary, score)), 100000);

  Ciphertext bonus = evaluator_->Add(
      evaluator_->Multiply(encryptor_->Encrypt(1000), encryptor_->Encrypt(80)),
      evaluator_->Multiply(salary, score));
  EXPECT_EQ(decryptor_->Decrypt(bonus), 180000);
}

TEST_F(SealBfvTest, ZeroIsStable) {
  Ciphertext zero = evaluator_->EncryptZero();
  EXPECT_EQ(zero, evaluator_->EncryptZero());
  EXPECT_EQ(decryptor_->Decrypt(zero), 0);
}

TEST_F(SealBfvTest, OperationsAreDeterministic) {
  Ciphertext a = encryptor_->Encrypt(7);
  Ciphertext b = encryptor_->Encrypt(9);

  EXPECT_EQ(evaluator_->Add(a, b), evaluator_->Add(a, b));
  EXPECT_EQ(evaluator_->Multiply(a, b), evaluator_->Multiply(a, b));
  // fresh encryptions are randomized
  EXPECT_NE(encryptor_->Encrypt(7), a);
}

TEST_F(SealBfvTest, IsInitialized) {
  EXPECT_TRUE(evaluator_->IsInitialized(encryptor_->Encrypt(3)));
  EXPECT_FALSE(evaluator_->IsInitialized(Ciphertext()));
  EXPECT_FALSE(evaluator_->IsInitialized(Ciphertext("not a ciphertext")));
  EXPECT_TRUE(evaluator_->IsInitialized(
      evaluator_->Multiply(encryptor_->Encrypt(3), encryptor_->Encrypt(4))));
  EXPECT_THROW(evaluator_->Add(Ciphertext(), encryptor_->Encrypt(1)),
               yacl::Exception);
}

TEST_F(SealBfvTest, RejectsUnrelinearizedCiphertexts) {
  seal::Evaluator seal_evaluator(ctx_->context());
  seal::Ciphertext product;
  seal_evaluator.multiply(
      ctx_->DeSerializeSealObject<seal::Ciphertext>(
          encryptor_->Encrypt(3).bytes()),
      ctx_->DeSerializeSealObject<seal::Ciphertext>(
          encryptor_->Encrypt(4).bytes()),
      product);
  ASSERT_EQ(product.size(), 3);

  Ciphertext unrelinearized(ctx_->SerializeSealObject(product));
  EXPECT_FALSE(evaluator_->IsInitialized(unrelinearized));
  // still a valid ciphertext, just not one the evaluator folds
  EXPECT_EQ(decryptor_->Decrypt(unrelinearized), 12);
}

}  // namespace

}  // namespace confagg
