#include "frostcoord/crypto/encoding.hpp"

#include <stdexcept>

namespace frostcoord {
namespace {

constexpr char kHexDigits[] = "0123456789abcdef";
constexpr size_t kScalarHexLen = 64;
constexpr size_t kCompressedHexLen = 66;
constexpr size_t kUncompressedHexLen = 130;

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const uint8_t> bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (uint8_t byte : bytes) {
    out.push_back(kHexDigits[(byte >> 4) & 0x0F]);
    out.push_back(kHexDigits[byte & 0x0F]);
  }
  return out;
}

Bytes HexDecode(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("Hex string must have even length");
  }

  Bytes out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    const int hi = HexNibble(hex[i]);
    const int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("Hex string contains a non-hex character");
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::string EncodePointHex(const ECPoint& point) {
  return HexEncode(point.ToCompressedBytes());
}

ECPoint DecodePointHex(std::string_view hex) {
  if (hex.size() != kCompressedHexLen && hex.size() != kUncompressedHexLen) {
    throw std::invalid_argument("Point hex must be 66 or 130 characters, got " +
                                std::to_string(hex.size()));
  }
  return ECPoint::FromSec1(HexDecode(hex));
}

std::string EncodeScalarHex(const Scalar& scalar) {
  return HexEncode(scalar.ToCanonicalBytes());
}

Scalar DecodeScalarHex(std::string_view hex) {
  if (hex.size() != kScalarHexLen) {
    throw std::invalid_argument("Scalar hex must be 64 characters, got " +
                                std::to_string(hex.size()));
  }
  return Scalar::FromCanonicalBytes(HexDecode(hex));
}

Scalar DecodeNonZeroScalarHex(std::string_view hex) {
  const Scalar out = DecodeScalarHex(hex);
  if (out.IsZero()) {
    throw std::invalid_argument("Scalar must be non-zero");
  }
  return out;
}

}  // namespace frostcoord
