#include "core/RelayService.hpp"

#include "common/Logger.hpp"
#include "core/MaintenanceScheduler.hpp"
#include "platform/IPlatformClient.hpp"
#include "pool/SessionPool.hpp"
#include "queue/IAccessPolicy.hpp"
#include "reaper/MemoryMonitor.hpp"
#include "transfer/MediaGroupSequencer.hpp"

namespace relay::core {

namespace {
constexpr const char* kSweepTask = "resource-sweep";
constexpr const char* kPruneTask = "job-record-prune";
constexpr const char* kMemoryTask = "memory-check";
}  // namespace

RelayService::RelayService(const common::Config& cfg, platform::ISessionFactory& sfFactory,
                           const queue::IAccessPolicy* pAccessPolicy)
    : _durShutdownGrace(cfg.iShutdownGraceSeconds) {
  auto spLog = common::Logger::get();

  _upStaging = std::make_unique<transfer::StagingArea>(cfg.sStagingDir, _rlLedger);
  _upPool = std::make_unique<pool::SessionPool>(
      sfFactory, cfg.iPoolSize, std::chrono::seconds(cfg.iSessionIdleTimeoutSeconds));

  transfer::SequencerOptions soOptions;
  soOptions.iMaxItemBytes = cfg.iMaxItemBytes;
  soOptions.iMaxDownloadConnections = cfg.iMaxDownloadConnections;
  soOptions.iMaxUploadConnections = cfg.iMaxUploadConnections;
  _upSequencer = std::make_unique<transfer::MediaGroupSequencer>(*_upStaging, soOptions);

  if (!pAccessPolicy) {
    _upOwnedPolicy =
        std::make_unique<queue::TierAccessPolicy>(cfg.iFreeActiveJobs, cfg.iPremiumActiveJobs);
    pAccessPolicy = _upOwnedPolicy.get();
  }

  queue::QueueOptions qoOptions;
  qoOptions.iBacklog = cfg.iQueueBacklog;
  qoOptions.iWorkers = cfg.iPoolSize;
  qoOptions.durAcquireTimeout = std::chrono::seconds(cfg.iAcquireTimeoutSeconds);
  qoOptions.iAcquireRetries = cfg.iAcquireRetries;
  qoOptions.durRetention = std::chrono::seconds(cfg.iJobRetentionSeconds);
  _upQueue = std::make_unique<queue::QueueManager>(*_upPool, *_upSequencer, *pAccessPolicy,
                                                   qoOptions);

  _upReaper = std::make_unique<reaper::ResourceReaper>(
      _upStaging->root(), _rlLedger, *_upPool, std::chrono::seconds(cfg.iOrphanGraceSeconds));

  _upScheduler = std::make_unique<MaintenanceScheduler>();
  _upScheduler->schedule(kSweepTask, std::chrono::seconds(cfg.iReaperIntervalSeconds),
                         [this]() { _upReaper->sweep(); });
  _upScheduler->schedule(kPruneTask, std::chrono::seconds(cfg.iReaperIntervalSeconds),
                         [this]() {
                           int iPruned = _upQueue->pruneFinished();
                           if (iPruned > 0) {
                             common::Logger::get()->info("Pruned {} finished job records",
                                                         iPruned);
                           }
                         });

  if (cfg.iMemoryLimitMb > 0) {
    _upMemoryMonitor = std::make_unique<reaper::MemoryMonitor>(
        static_cast<int64_t>(cfg.iMemoryLimitMb) * 1024 * 1024,
        [this](int64_t) { onMemoryPressure(); });
    _upScheduler->schedule(kMemoryTask, std::chrono::seconds(cfg.iMemoryCheckIntervalSeconds),
                           [this]() { _upMemoryMonitor->check(); });
  }

  spLog->info("Relay service assembled: pool={}, backlog={}, staging={}", cfg.iPoolSize,
              cfg.iQueueBacklog, _upStaging->root().string());
}

RelayService::~RelayService() {
  shutdown();
}

void RelayService::start() {
  if (_bShutdown.load() || _bStarted.exchange(true)) return;
  _upQueue->start();
  _upScheduler->start();
  common::Logger::get()->info("Relay service started");
}

std::string RelayService::submit(common::TransferJob tjJob) {
  return _upQueue->submit(std::move(tjJob));
}

bool RelayService::cancel(const std::string& sJobId) {
  return _upQueue->cancel(sJobId);
}

std::optional<queue::JobSnapshot> RelayService::status(const std::string& sJobId) const {
  return _upQueue->status(sJobId);
}

int RelayService::subscribe(queue::StatusListener fnListener) {
  return _upQueue->subscribe(std::move(fnListener));
}

bool RelayService::waitIdle(std::chrono::milliseconds durTimeout) {
  return _upQueue->waitIdle(durTimeout);
}

void RelayService::onMemoryPressure() {
  if (_bStarted.load() && !_bShutdown.load() && _upScheduler->trigger(kSweepTask)) {
    return;
  }
  _upReaper->sweep();
}

reaper::SweepReport RelayService::sweepNow() {
  return _upReaper->sweep();
}

reaper::SweepReport RelayService::shutdown() {
  if (_bShutdown.exchange(true)) return {};

  auto spLog = common::Logger::get();
  spLog->info("Relay service shutting down (grace {}s)", _durShutdownGrace.count());

  _upScheduler->stop();
  _upQueue->shutdown(_durShutdownGrace, [this]() { _upPool->shutdown(); });
  _upPool->shutdown();

  auto srFinal = _upReaper->sweep(std::chrono::seconds::zero());
  spLog->info("Relay service stopped: final sweep removed {} files, {} sessions open",
              srFinal.iRemoved, _upPool->size());
  return srFinal;
}

}  // namespace relay::core
