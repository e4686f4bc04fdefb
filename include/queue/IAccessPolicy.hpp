#pragma once

#include <cstdint>

#include "common/Types.hpp"

namespace relay::queue {

/// Access-control collaborator consulted at dispatch time.
///
/// maxActiveJobs() is called with the queue lock held, at most once per owner
/// per dispatch pass. Implementations must return quickly and must not call
/// back into the QueueManager.
class IAccessPolicy {
 public:
  virtual ~IAccessPolicy() = default;

  /// Maximum number of simultaneously active jobs for this owner. 0 = unlimited.
  virtual int maxActiveJobs(int64_t iOwnerId, common::Tier tier) const = 0;
};

/// Fixed per-tier ceilings.
/// Class abbreviation: tap
class TierAccessPolicy : public IAccessPolicy {
 public:
  TierAccessPolicy(int iFreeActiveJobs, int iPremiumActiveJobs)
      : _iFreeActiveJobs(iFreeActiveJobs), _iPremiumActiveJobs(iPremiumActiveJobs) {}

  int maxActiveJobs(int64_t /*iOwnerId*/, common::Tier tier) const override {
    return tier == common::Tier::Premium ? _iPremiumActiveJobs : _iFreeActiveJobs;
  }

 private:
  int _iFreeActiveJobs;
  int _iPremiumActiveJobs;
};

}  // namespace relay::queue
