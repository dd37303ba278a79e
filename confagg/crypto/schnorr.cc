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

#include <utility>

#include "spdlog/spdlog.h"
#include "yacl/base/exception.h"
#include "yacl/crypto/hash/ssl_hash.h"

#include "confagg/proto/ledger.pb.h"

namespace confagg {

namespace {

std::string BufferToString(const yacl::Buffer& buf) {
  return std::string(buf.data<char>(), buf.size());
}

}  // namespace

std::shared_ptr<yacl::crypto::EcGroup> CreateSignatureCurve(
    const std::string& curve_name) {
  std::shared_ptr<yacl::crypto::EcGroup> curve =
      yacl::crypto::EcGroupFactory::Instance().Create(
          curve_name, yacl::ArgLib = "openssl");
  YACL_ENFORCE(curve != nullptr, "unsupported curve {}", curve_name);
  return curve;
}

yacl::math::MPInt SchnorrChallenge(
    const std::shared_ptr<yacl::crypto::EcGroup>& curve,
    const yacl::crypto::EcPoint& r, const yacl::crypto::EcPoint& pk,
    const std::string& msg) {
  yacl::crypto::Sha256Hash hash;
  hash.Update(curve->SerializePoint(r));
  hash.Update(curve->SerializePoint(pk));
  hash.Update(msg);
  std::vector<uint8_t> digest = hash.CumulativeHash();

  yacl::math::MPInt e;
  e.FromMagBytes(yacl::ByteContainerView(digest.data(), digest.size()),
                 yacl::Endian::big);
  return e.Mod(curve->GetOrder());
}

SchnorrSigner::SchnorrSigner(std::shared_ptr<yacl::crypto::EcGroup> curve)
    : curve_(std::move(curve)) {
  YACL_ENFORCE(curve_ != nullptr);
  do {
    yacl::math::MPInt::RandomLtN(curve_->GetOrder(), &x_);
  } while (x_.IsZero());
  pk_ = curve_->MulBase(x_);
}

SchnorrSigner::SchnorrSigner(std::shared_ptr<yacl::crypto::EcGroup> curve,
                             const yacl::math::MPInt& x)
    : curve_(std::move(curve)), x_(x) {
  YACL_ENFORCE(curve_ != nullptr);
  YACL_ENFORCE(!x_.IsZero() && x_ < curve_->GetOrder(),
               "signing key out of range");
  pk_ = curve_->MulBase(x_);
}

std::string SchnorrSigner::Sign(const std::string& msg) const {
  const auto& order = curve_->GetOrder();

  yacl::math::MPInt k;
  do {
    yacl::math::MPInt::RandomLtN(order, &k);
  } while (k.IsZero());

  yacl::crypto::EcPoint r = curve_->MulBase(k);
  yacl::math::MPInt e = SchnorrChallenge(curve_, r, pk_, msg);
  yacl::math::MPInt s = k.AddMod(e.MulMod(x_, order), order);

  SchnorrSignatureProto proto;
  proto.set_r(BufferToString(curve_->SerializePoint(r)));
  proto.set_s(BufferToString(s.Serialize()));
  std::string out;
  YACL_ENFORCE(proto.SerializeToString(&out));
  return out;
}

bool SchnorrVerifier::Verify(const std::string& msg,
                             const std::string& signature) const {
  SchnorrSignatureProto proto;
  if (!proto.ParseFromString(signature) || proto.r().empty() ||
      proto.s().empty()) {
    return false;
  }

  try {
    yacl::crypto::EcPoint r = curve_->DeserializePoint(proto.r());
    yacl::math::MPInt s;
    s.Deserialize(proto.s());
    if (s.IsNegative() || s >= curve_->GetOrder()) {
      return false;
    }

    yacl::math::MPInt e = SchnorrChallenge(curve_, r, pk_, msg);
    // s * G == R + e * PK
    return curve_->PointEqual(curve_->MulBase(s),
                              curve_->Add(r, curve_->Mul(pk_, e)));
  } catch (const std::exception& ex) {
    SPDLOG_WARN("malformed signature: {}", ex.what());
    return false;
  }
}

}  // namespace confagg
