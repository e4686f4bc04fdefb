#pragma once

#include <chrono>
#include <filesystem>

namespace relay::pool {
class SessionPool;
}

namespace relay::transfer {
class ResourceLedger;
}

namespace relay::reaper {

/// Outcome of one sweep.
/// Class abbreviation: swr
struct SweepReport {
  int iScanned = 0;
  int iRemoved = 0;
  int iFailed = 0;
  int iSessionsEvicted = 0;
};

/// Safety net for staging files and sessions that outlived their owners.
/// Deletes staging entries that are not in the ledger and are older than the
/// grace period, then evicts idle sessions. Never throws.
/// Class abbreviation: rr
class ResourceReaper {
 public:
  ResourceReaper(std::filesystem::path pathStaging, const transfer::ResourceLedger& rlLedger,
                 pool::SessionPool& spPool, std::chrono::seconds durGrace);
  ~ResourceReaper();

  /// Sweep with the configured grace period.
  SweepReport sweep();

  /// Sweep with an explicit grace period (zero on the final shutdown sweep).
  SweepReport sweep(std::chrono::seconds durGrace);

 private:
  /// Scan the staging directory and delete orphans into srReport.
  void sweepFiles(std::chrono::seconds durGrace, SweepReport& srReport);

  std::filesystem::path _pathStaging;
  const transfer::ResourceLedger& _rlLedger;
  pool::SessionPool& _spPool;
  std::chrono::seconds _durGrace;
};

}  // namespace relay::reaper
