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

#include "confagg/crypto/schnorr.h"

#include "gtest/gtest.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

namespace {

TEST(SchnorrTest, Works) {
  auto curve = CreateSignatureCurve();
  SchnorrSigner signer(curve);
  SchnorrVerifier verifier(curve, signer.public_key());

  std::string sig = signer.Sign("payroll|1|totals");
  EXPECT_TRUE(verifier.Verify("payroll|1|totals", sig));
  EXPECT_FALSE(verifier.Verify("payroll|2|totals", sig));
}

TEST(SchnorrTest, WrongKey) {
  auto curve = CreateSignatureCurve();
  SchnorrSigner signer(curve);
  SchnorrSigner other(curve);
  SchnorrVerifier verifier(curve, other.public_key());

  EXPECT_FALSE(verifier.Verify("msg", signer.Sign("msg")));
}

TEST(SchnorrTest, FixedKey) {
  auto curve = CreateSignatureCurve();
  yacl::math::MPInt x(12345);
  SchnorrSigner signer(curve, x);
  EXPECT_TRUE(curve->PointEqual(signer.public_key(), curve->MulBase(x)));

  SchnorrVerifier verifier(curve, signer.public_key());
  EXPECT_TRUE(verifier.Verify("msg", signer.Sign("msg")));
}

TEST(SchnorrTest, MalformedSignature) {
  auto curve = CreateSignatureCurve();
  SchnorrSigner signer(curve);
  SchnorrVerifier verifier(curve, signer.public_key());

  EXPECT_FALSE(verifier.Verify("msg", ""));
  EXPECT_FALSE(verifier.Verify("msg", "garbage"));

  SchnorrSignatureProto proto;
  ASSERT_TRUE(proto.ParseFromString(signer.Sign("msg")));
  proto.set_r("not a point");
  EXPECT_FALSE(verifier.Verify("msg", proto.SerializeAsString()));
}

TEST(SchnorrTest, TamperedScalar) {
  auto curve = CreateSignatureCurve();
  SchnorrSigner signer(curve);
  SchnorrVerifier verifier(curve, signer.public_key());

  SchnorrSignatureProto proto;
  ASSERT_TRUE(proto.ParseFromString(signer.Sign("msg")));

  SchnorrSignatureProto other;
  ASSERT_TRUE(other.ParseFromString(signer.Sign("msg")));
  proto.set_s(other.s());
  EXPECT_FALSE(verifier.Verify("msg", proto.SerializeAsString()));
}

}  // namespace

}  // namespace confagg
