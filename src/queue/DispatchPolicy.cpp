#include "queue/DispatchPolicy.hpp"

namespace relay::queue {

namespace {
int tierRank(common::Tier tier) {
  return tier == common::Tier::Premium ? 0 : 1;
}
}  // namespace

bool dispatchesBefore(const common::TransferJob& tjA, const common::TransferJob& tjB) {
  const int iRankA = tierRank(tjA.tier);
  const int iRankB = tierRank(tjB.tier);
  if (iRankA != iRankB) {
    return iRankA < iRankB;
  }
  return tjA.iArrivalSeq < tjB.iArrivalSeq;
}

}  // namespace relay::queue
