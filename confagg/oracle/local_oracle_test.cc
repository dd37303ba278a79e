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

#include <memory>

#include "gtest/gtest.h"
#include "yacl/base/exception.h"

namespace confagg {

namespace {

class LocalOracleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ctx_ = std::make_shared<SealBfvContext>(BfvParams());
    keys_ = SealBfvKeys::Generate(*ctx_);
    encryptor_ = std::make_unique<SealBfvEncryptor>(ctx_, keys_.public_key);
    oracle_ = std::make_unique<LocalDecryptionOracle>(ctx_, keys_.secret_key,
                                                      "oracle-test");
  }

  std::shared_ptr<SealBfvContext> ctx_;
  SealBfvKeys keys_;
  std::unique_ptr<SealBfvEncryptor> encryptor_;
  std::unique_ptr<LocalDecryptionOracle> oracle_;
};

TEST_F(LocalOracleTest, Works) {
  RequestId id = oracle_->RequestDecryption(
      {encryptor_->Encrypt(3000), encryptor_->Encrypt(180000)});
  EXPECT_EQ(id, 1);
  EXPECT_EQ(oracle_->PendingRequests(), std::vector<RequestId>{id});

  DecryptionResponse response = oracle_->Fulfill(id);
  EXPECT_EQ(response.request_id, id);
  EXPECT_EQ(DecodeCleartexts(response.cleartexts),
            (std::vector<uint64_t>{3000, 180000}));
  EXPECT_TRUE(oracle_->PendingRequests().empty());

  EXPECT_TRUE(oracle_->VerifyProof(id, response.cleartexts, response.proof));
}

TEST_F(LocalOracleTest, RequestIdsAreSequential) {
  RequestId first = oracle_->RequestDecryption({encryptor_->Encrypt(1)});
  RequestId second = oracle_->RequestDecryption({encryptor_->Encrypt(2)});
  EXPECT_EQ(second, first + 1);
}

TEST_F(LocalOracleTest, ProofBindsRequestAndCleartexts) {
  RequestId first = oracle_->RequestDecryption({encryptor_->Encrypt(10)});
  RequestId second = oracle_->RequestDecryption({encryptor_->Encrypt(10)});
  auto response = oracle_->Fulfill(first);

  EXPECT_FALSE(
      oracle_->VerifyProof(second, response.cleartexts, response.proof));
  EXPECT_FALSE(oracle_->VerifyProof(first, EncodeCleartexts({11}),
                                    response.proof));
  // never issued
  EXPECT_FALSE(
      oracle_->VerifyProof(first + 10, response.cleartexts, response.proof));
}

TEST_F(LocalOracleTest, ProofBindsDomain) {
  LocalDecryptionOracle other(ctx_, keys_.secret_key, "other-domain");
  RequestId id = other.RequestDecryption({encryptor_->Encrypt(5)});
  auto response = other.Fulfill(id);

  oracle_->RequestDecryption({encryptor_->Encrypt(5)});
  EXPECT_FALSE(oracle_->VerifyProof(id, response.cleartexts, response.proof));
}

TEST_F(LocalOracleTest, FulfillTwiceThrows) {
  RequestId id = oracle_->RequestDecryption({encryptor_->Encrypt(1)});
  oracle_->Fulfill(id);
  EXPECT_THROW(oracle_->Fulfill(id), yacl::Exception);
  EXPECT_THROW(oracle_->RequestDecryption({Ciphertext()}), yacl::Exception);
}

TEST(CleartextsTest, Works) {
  std::vector<uint64_t> values = {0, 42, 1ULL << 40};
  EXPECT_EQ(DecodeCleartexts(EncodeCleartexts(values)), values);
  EXPECT_THROW(DecodeCleartexts("\xff\xff"), yacl::Exception);
}

}  // namespace

}  // namespace confagg
