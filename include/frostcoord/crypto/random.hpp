#pragma once

#include <cstddef>
#include <string>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomNonZeroScalar();
  // 16 random bytes rendered as 32 lowercase hex characters.
  static std::string RandomSessionId();
};

}  // namespace frostcoord
