#include "platform/TransferTuning.hpp"

#include <algorithm>
#include <cmath>

namespace relay::platform {

int optimizedConnectionCount(int64_t iBytes, int iMaxCount, int64_t iFullSize) {
  if (iMaxCount < 1) {
    return 1;
  }
  if (iFullSize <= 0 || iBytes >= iFullSize) {
    return iMaxCount;
  }

  const int iMinConnections = std::max(1, std::min(6, iMaxCount / 2));
  const double dShare = static_cast<double>(std::max<int64_t>(iBytes, 0)) /
                        static_cast<double>(iFullSize);
  const int iScaled = static_cast<int>(std::ceil(dShare * iMaxCount));
  return std::max(iMinConnections, iScaled);
}

}  // namespace relay::platform
