#include "frostcoord/crypto/ec_point.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

extern "C" {
#include <secp256k1.h>
}

namespace frostcoord {
namespace {

constexpr size_t kCompressedLen = 33;
constexpr size_t kUncompressedLen = 65;

secp256k1_context* GetSecpContext() {
  static secp256k1_context* ctx = []() {
    secp256k1_context* created = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (created == nullptr) {
      throw std::runtime_error("Failed to create secp256k1 context");
    }
    return created;
  }();
  return ctx;
}

secp256k1_pubkey ParsePubkey(std::span<const uint8_t> encoded) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, encoded.data(), encoded.size()) != 1) {
    throw std::invalid_argument("Encoded point is not a valid secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, kCompressedLen> SerializeCompressed(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, kCompressedLen> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          GetSecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
  compressed_[0] = 0x02;
}

ECPoint ECPoint::FromSec1(std::span<const uint8_t> encoded) {
  if (encoded.size() != kCompressedLen && encoded.size() != kUncompressedLen) {
    throw std::invalid_argument("SEC1 point must be 33 or 65 bytes");
  }
  if (encoded.size() == kCompressedLen && encoded[0] != 0x02 && encoded[0] != 0x03) {
    throw std::invalid_argument("Compressed point prefix must be 0x02 or 0x03");
  }
  if (encoded.size() == kUncompressedLen && encoded[0] != 0x04) {
    throw std::invalid_argument("Uncompressed point prefix must be 0x04");
  }

  const secp256k1_pubkey pubkey = ParsePubkey(encoded);

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_create(GetSecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Generator multiplication failed: scalar must be in [1, n-1]");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  const secp256k1_pubkey lhs = ParsePubkey(compressed_);
  const secp256k1_pubkey rhs = ParsePubkey(other.compressed_);

  const secp256k1_pubkey* inputs[2] = {&lhs, &rhs};
  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(GetSecpContext(), &combined, inputs, 2) != 1) {
    throw std::invalid_argument("Point addition failed (sum is point at infinity?)");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(combined);
  return out;
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(GetSecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Point scalar multiplication failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

Bytes ECPoint::ToXOnlyBytes() const {
  return Bytes(compressed_.begin() + 1, compressed_.end());
}

bool ECPoint::HasEvenY() const {
  return compressed_[0] == 0x02;
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

}  // namespace frostcoord
