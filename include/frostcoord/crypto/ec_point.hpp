#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

// Non-infinity secp256k1 point, held in compressed SEC1 form.
class ECPoint {
 public:
  ECPoint();

  // Accepts 33-byte compressed or 65-byte uncompressed SEC1 encodings.
  static ECPoint FromSec1(std::span<const uint8_t> encoded);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  Bytes ToCompressedBytes() const;
  // 32-byte x coordinate, the BIP-340 encoding of the even-y lift.
  Bytes ToXOnlyBytes() const;
  bool HasEvenY() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace frostcoord
