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

#include <memory>
#include <string>

#include "yacl/crypto/ecc/ec_point.h"
#include "yacl/crypto/ecc/ecc_spi.h"
#include "yacl/math/mpint/mp_int.h"

namespace confagg {

inline constexpr char kDefaultSignatureCurve[] = "secp256k1";

std::shared_ptr<yacl::crypto::EcGroup> CreateSignatureCurve(
    const std::string& curve_name = kDefaultSignatureCurve);

// Schnorr signatures, used by the decryption oracle to prove which
// cleartexts it released for which request.
//
//   R = k * G, e = H(R || PK || msg) mod n, s = k + e * x mod n
//
class SchnorrSigner {
 public:
  // Samples a fresh signing key.
  explicit SchnorrSigner(std::shared_ptr<yacl::crypto::EcGroup> curve);

  SchnorrSigner(std::shared_ptr<yacl::crypto::EcGroup> curve,
                const yacl::math::MPInt& x);

  // Returns a serialized SchnorrSignatureProto.
  std::string Sign(const std::string& msg) const;

  const yacl::crypto::EcPoint& public_key() const { return pk_; }

  const std::shared_ptr<yacl::crypto::EcGroup>& curve() const {
    return curve_;
  }

 private:
  std::shared_ptr<yacl::crypto::EcGroup> curve_;
  // private key sk = x_
  yacl::math::MPInt x_;
  // public key pk = sk * G
  yacl::crypto::EcPoint pk_;
};

class SchnorrVerifier {
 public:
  SchnorrVerifier(std::shared_ptr<yacl::crypto::EcGroup> curve,
                  const yacl::crypto::EcPoint& public_key)
      : curve_(std::move(curve)), pk_(public_key) {}

  // Malformed signatures verify as false.
  bool Verify(const std::string& msg, const std::string& signature) const;

 private:
  std::shared_ptr<yacl::crypto::EcGroup> curve_;
  yacl::crypto::EcPoint pk_;
};

// e = SHA-256(R || PK || msg) mod n
yacl::math::MPInt SchnorrChallenge(
    const std::shared_ptr<yacl::crypto::EcGroup>& curve,
    const yacl::crypto::EcPoint& r, const yacl::crypto::EcPoint& pk,
    const std::string& msg);

}  // namespace confagg
