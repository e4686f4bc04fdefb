#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "common/Config.hpp"
#include "common/Types.hpp"
#include "queue/QueueManager.hpp"
#include "reaper/ResourceReaper.hpp"
#include "transfer/StagingArea.hpp"

namespace relay::platform {
class ISessionFactory;
}

namespace relay::pool {
class SessionPool;
}

namespace relay::transfer {
class MediaGroupSequencer;
}

namespace relay::queue {
class IAccessPolicy;
}

namespace relay::reaper {
class MemoryMonitor;
}

namespace relay::core {

class MaintenanceScheduler;

/// Composition root of the transfer pipeline: session pool, queue manager,
/// media group sequencer, resource reaper and their maintenance schedule.
///
/// Shutdown order: stop admitting → running jobs finish their current item
/// within the grace period → in-flight transfers are aborted → pool closed →
/// final zero-grace reaper sweep.
/// Class abbreviation: rs
class RelayService {
 public:
  /// pAccessPolicy may be null; a TierAccessPolicy from cfg is used then.
  RelayService(const common::Config& cfg, platform::ISessionFactory& sfFactory,
               const queue::IAccessPolicy* pAccessPolicy = nullptr);
  ~RelayService();

  RelayService(const RelayService&) = delete;
  RelayService& operator=(const RelayService&) = delete;

  /// Start workers and the maintenance schedule.
  void start();

  std::string submit(common::TransferJob tjJob);
  bool cancel(const std::string& sJobId);
  std::optional<queue::JobSnapshot> status(const std::string& sJobId) const;
  int subscribe(queue::StatusListener fnListener);
  bool waitIdle(std::chrono::milliseconds durTimeout);

  /// Memory-monitor signal: run a reaper sweep immediately.
  void onMemoryPressure();

  /// Run a sweep on the caller's thread.
  reaper::SweepReport sweepNow();

  /// Ordered shutdown; idempotent. Returns the final sweep report.
  reaper::SweepReport shutdown();

  pool::SessionPool& sessionPool() { return *_upPool; }
  queue::QueueManager& queueManager() { return *_upQueue; }
  transfer::ResourceLedger& ledger() { return _rlLedger; }

 private:
  std::chrono::seconds _durShutdownGrace;
  std::atomic<bool> _bStarted{false};
  std::atomic<bool> _bShutdown{false};

  transfer::ResourceLedger _rlLedger;
  std::unique_ptr<transfer::StagingArea> _upStaging;
  std::unique_ptr<pool::SessionPool> _upPool;
  std::unique_ptr<transfer::MediaGroupSequencer> _upSequencer;
  std::unique_ptr<queue::IAccessPolicy> _upOwnedPolicy;
  std::unique_ptr<queue::QueueManager> _upQueue;
  std::unique_ptr<reaper::ResourceReaper> _upReaper;
  std::unique_ptr<reaper::MemoryMonitor> _upMemoryMonitor;
  std::unique_ptr<MaintenanceScheduler> _upScheduler;
};

}  // namespace relay::core
