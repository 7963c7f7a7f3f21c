#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

std::string HexEncode(std::span<const uint8_t> bytes);
Bytes HexDecode(std::string_view hex);

// Points travel as hex SEC1: 66 chars compressed or 130 chars uncompressed.
// Encoding always emits the compressed form.
std::string EncodePointHex(const ECPoint& point);
ECPoint DecodePointHex(std::string_view hex);

// Scalars travel as 64 hex chars, big-endian. The nonzero decoder rejects
// 0 and anything >= n, which is what a signature share must satisfy.
std::string EncodeScalarHex(const Scalar& scalar);
Scalar DecodeScalarHex(std::string_view hex);
Scalar DecodeNonZeroScalarHex(std::string_view hex);

}  // namespace frostcoord
