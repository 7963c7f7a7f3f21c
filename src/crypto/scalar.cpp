#include "frostcoord/crypto/scalar.hpp"

#include <algorithm>
#include <stdexcept>

namespace frostcoord {
namespace {

const mpz_class kSecp256k1Order(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class NormalizeToN(const mpz_class& input) {
  mpz_class normalized = input % kSecp256k1Order;
  if (normalized < 0) {
    normalized += kSecp256k1Order;
  }
  return normalized;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("Big-endian input must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToN(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  return Scalar(mpz_class(value));
}

Scalar Scalar::FromBigEndianModN(std::span<const uint8_t> bytes) {
  return Scalar(ImportBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kSecp256k1Order) {
    throw std::invalid_argument("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};

  if (value_ == 0) {
    return out;
  }

  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value_.get_mpz_t());
  if (count > out.size()) {
    throw std::runtime_error("Scalar is larger than 32 bytes");
  }

  const size_t offset = out.size() - count;
  std::rotate(out.begin(), out.begin() + count, out.end());
  std::fill(out.begin(), out.begin() + offset, 0);
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::Inverse() const {
  mpz_class inverse;
  if (mpz_invert(inverse.get_mpz_t(), value_.get_mpz_t(), kSecp256k1Order.get_mpz_t()) == 0) {
    throw std::invalid_argument("Scalar zero has no inverse");
  }
  return Scalar(inverse);
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator-(const Scalar& other) const {
  return Scalar(value_ - other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusN() {
  return kSecp256k1Order;
}

}  // namespace frostcoord
