#pragma once

#include <cstdint>
#include <span>

#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

// R is kept as the aggregate nonce commitment; its BIP-340 encoding is x(R).
struct SchnorrSignature {
  ECPoint R;
  Scalar s;
};

// BIP-340 challenge: e = tagged_hash("BIP0340/challenge", x(R) || x(Y) || m) mod n.
Scalar SchnorrChallenge(const ECPoint& R,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> msg32);

// BIP-340 verification of (x(R), s) under the x-only key x(Y).
bool VerifySchnorr(const ECPoint& group_public_key,
                   std::span<const uint8_t> msg32,
                   const SchnorrSignature& signature);

// Lagrange basis polynomial for `index` evaluated at zero over the signer set.
// Indices are 1-based and must be unique.
Scalar LagrangeCoefficientAtZero(uint32_t index, std::span<const uint32_t> signer_indices);

// s_i = k_i + lambda_i * x_i * e, where k_i is negated when the aggregate
// commitment has odd y and x_i is negated when the group key has odd y.
Scalar ComputeSignatureShare(const Scalar& nonce,
                             const Scalar& secret_share,
                             const Scalar& lagrange_coefficient,
                             const Scalar& challenge,
                             const ECPoint& group_commitment,
                             const ECPoint& group_public_key);

}  // namespace frostcoord
