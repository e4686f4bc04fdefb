#include "queue/DispatchPolicy.hpp"
#include "queue/IAccessPolicy.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <vector>

using namespace relay::common;
using relay::queue::dispatchesBefore;
using relay::queue::TierAccessPolicy;

namespace {

TransferJob makeJob(const std::string& sId, Tier tier, uint64_t iSeq) {
  TransferJob tj;
  tj.sJobId = sId;
  tj.tier = tier;
  tj.iArrivalSeq = iSeq;
  return tj;
}

}  // namespace

TEST(DispatchPolicyTest, PremiumBeforeFreeRegardlessOfArrival) {
  auto tjFree = makeJob("free", Tier::Free, 1);
  auto tjPremium = makeJob("premium", Tier::Premium, 2);
  EXPECT_TRUE(dispatchesBefore(tjPremium, tjFree));
  EXPECT_FALSE(dispatchesBefore(tjFree, tjPremium));
}

TEST(DispatchPolicyTest, FifoWithinTier) {
  auto tjFirst = makeJob("a", Tier::Free, 1);
  auto tjSecond = makeJob("b", Tier::Free, 2);
  EXPECT_TRUE(dispatchesBefore(tjFirst, tjSecond));
  EXPECT_FALSE(dispatchesBefore(tjSecond, tjFirst));
  EXPECT_FALSE(dispatchesBefore(tjFirst, tjFirst));
}

TEST(DispatchPolicyTest, SortsMixedQueue) {
  std::vector<TransferJob> vJobs = {
      makeJob("f1", Tier::Free, 1),    makeJob("p1", Tier::Premium, 2),
      makeJob("f2", Tier::Free, 3),    makeJob("p2", Tier::Premium, 4),
  };
  std::stable_sort(vJobs.begin(), vJobs.end(), dispatchesBefore);

  std::vector<std::string> vOrder;
  for (const auto& tj : vJobs) vOrder.push_back(tj.sJobId);
  EXPECT_EQ(vOrder, (std::vector<std::string>{"p1", "p2", "f1", "f2"}));
}

TEST(DispatchPolicyTest, TierAccessPolicyReturnsPerTierCeiling) {
  TierAccessPolicy tap(1, 0);
  EXPECT_EQ(tap.maxActiveJobs(42, Tier::Free), 1);
  EXPECT_EQ(tap.maxActiveJobs(42, Tier::Premium), 0);
}
