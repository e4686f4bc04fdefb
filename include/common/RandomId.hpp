#pragma once

#include <cstddef>
#include <string>

namespace relay::common {

/// Generate iBytes of cryptographically random data as lowercase hex (2*iBytes chars).
/// Used for job ids and staging file names. Throws std::runtime_error if the
/// OpenSSL RNG fails.
std::string randomHex(std::size_t iBytes);

}  // namespace relay::common
