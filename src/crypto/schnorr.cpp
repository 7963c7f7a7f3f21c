#include "frostcoord/crypto/schnorr.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

extern "C" {
#include <secp256k1.h>
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
}

namespace frostcoord {
namespace {

constexpr char kChallengeTag[] = "BIP0340/challenge";
constexpr size_t kMessageHashLen = 32;
constexpr size_t kXOnlyLen = 32;

secp256k1_context* GetVerifyContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

}  // namespace

Scalar SchnorrChallenge(const ECPoint& R,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> msg32) {
  if (msg32.size() != kMessageHashLen) {
    throw std::invalid_argument("Schnorr message hash must be 32 bytes");
  }

  Bytes data = R.ToXOnlyBytes();
  const Bytes y_bytes = group_public_key.ToXOnlyBytes();
  data.insert(data.end(), y_bytes.begin(), y_bytes.end());
  data.insert(data.end(), msg32.begin(), msg32.end());

  std::array<uint8_t, 32> digest{};
  if (secp256k1_tagged_sha256(GetVerifyContext(),
                              digest.data(),
                              reinterpret_cast<const unsigned char*>(kChallengeTag),
                              sizeof(kChallengeTag) - 1,
                              data.data(),
                              data.size()) != 1) {
    throw std::runtime_error("BIP-340 challenge hash failed");
  }
  return Scalar::FromBigEndianModN(digest);
}

bool VerifySchnorr(const ECPoint& group_public_key,
                   std::span<const uint8_t> msg32,
                   const SchnorrSignature& signature) {
  if (msg32.size() != kMessageHashLen || signature.s.IsZero()) {
    return false;
  }

  const Bytes y_bytes = group_public_key.ToXOnlyBytes();
  secp256k1_xonly_pubkey xonly_public_key;
  if (secp256k1_xonly_pubkey_parse(GetVerifyContext(), &xonly_public_key, y_bytes.data()) != 1) {
    return false;
  }

  std::array<uint8_t, 2 * kXOnlyLen> sig64{};
  const Bytes r_bytes = signature.R.ToXOnlyBytes();
  const std::array<uint8_t, 32> s_bytes = signature.s.ToCanonicalBytes();
  std::copy(r_bytes.begin(), r_bytes.end(), sig64.begin());
  std::copy(s_bytes.begin(), s_bytes.end(), sig64.begin() + kXOnlyLen);

  return secp256k1_schnorrsig_verify(
             GetVerifyContext(), sig64.data(), msg32.data(), msg32.size(), &xonly_public_key) == 1;
}

Scalar LagrangeCoefficientAtZero(uint32_t index, std::span<const uint32_t> signer_indices) {
  if (index == 0) {
    throw std::invalid_argument("Lagrange index must be non-zero");
  }

  bool present = false;
  Scalar numerator = Scalar::FromUint64(1);
  Scalar denominator = Scalar::FromUint64(1);
  for (uint32_t other : signer_indices) {
    if (other == 0) {
      throw std::invalid_argument("Lagrange signer indices must be non-zero");
    }
    if (other == index) {
      if (present) {
        throw std::invalid_argument("Lagrange signer indices must be unique");
      }
      present = true;
      continue;
    }

    const Scalar x_j = Scalar::FromUint64(other);
    const Scalar x_i = Scalar::FromUint64(index);
    numerator = numerator * x_j;
    denominator = denominator * (x_j - x_i);
  }

  if (!present) {
    throw std::invalid_argument("Lagrange index must be in the signer set");
  }
  return numerator * denominator.Inverse();
}

Scalar ComputeSignatureShare(const Scalar& nonce,
                             const Scalar& secret_share,
                             const Scalar& lagrange_coefficient,
                             const Scalar& challenge,
                             const ECPoint& group_commitment,
                             const ECPoint& group_public_key) {
  const Scalar k = group_commitment.HasEvenY() ? nonce : Scalar() - nonce;
  const Scalar x = group_public_key.HasEvenY() ? secret_share : Scalar() - secret_share;
  return k + lagrange_coefficient * x * challenge;
}

}  // namespace frostcoord
