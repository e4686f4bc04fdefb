#include "common/RandomId.hpp"

#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace relay::common {

std::string randomHex(std::size_t iBytes) {
  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::vector<unsigned char> vRaw(iBytes);
  if (RAND_bytes(vRaw.data(), static_cast<int>(vRaw.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }

  std::string sResult;
  sResult.reserve(iBytes * 2);
  for (unsigned char c : vRaw) {
    sResult.push_back(kHexDigits[c >> 4]);
    sResult.push_back(kHexDigits[c & 0x0F]);
  }
  return sResult;
}

}  // namespace relay::common
