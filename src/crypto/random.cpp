#include "frostcoord/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "frostcoord/crypto/encoding.hpp"

namespace frostcoord {
namespace {

constexpr size_t kSessionIdBytes = 16;

}  // namespace

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    const Bytes bytes = RandomBytes(32);
    try {
      const Scalar candidate = Scalar::FromCanonicalBytes(bytes);
      if (!candidate.IsZero()) {
        return candidate;
      }
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

std::string Csprng::RandomSessionId() {
  return HexEncode(RandomBytes(kSessionIdBytes));
}

}  // namespace frostcoord
