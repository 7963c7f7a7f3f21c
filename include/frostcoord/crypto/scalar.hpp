#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace frostcoord {

// Integer modulo the secp256k1 group order n.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModN(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  const mpz_class& value() const;
  bool IsZero() const;
  Scalar Inverse() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusN();

 private:
  mpz_class value_;
};

}  // namespace frostcoord
