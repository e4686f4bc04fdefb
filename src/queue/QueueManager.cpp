#include "queue/QueueManager.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/RandomId.hpp"
#include "pool/SessionPool.hpp"
#include "queue/DispatchPolicy.hpp"
#include "queue/IAccessPolicy.hpp"
#include "transfer/MediaGroupSequencer.hpp"

#include <algorithm>

namespace relay::queue {

using common::EventType;
using common::JobState;

namespace {

EventType eventFor(JobState state) {
  switch (state) {
    case JobState::Queued: return EventType::Queued;
    case JobState::Running: return EventType::Running;
    case JobState::Completed: return EventType::Completed;
    case JobState::Failed: return EventType::Failed;
    case JobState::Cancelled: return EventType::Cancelled;
  }
  return EventType::Failed;
}

/// Terminal state of a job whose group ran to the end of its item list.
JobState outcomeOf(const common::GroupResult& gr) {
  if (gr.iCancelled > 0) return JobState::Cancelled;
  if (gr.bSessionLost || gr.iSucceeded == 0) return JobState::Failed;
  return JobState::Completed;
}

}  // namespace

QueueManager::QueueManager(pool::SessionPool& spPool,
                           transfer::MediaGroupSequencer& mgsSequencer,
                           const IAccessPolicy& apPolicy, QueueOptions qoOptions)
    : _spPool(spPool),
      _mgsSequencer(mgsSequencer),
      _apPolicy(apPolicy),
      _qoOptions(qoOptions) {
  if (_qoOptions.iWorkers < 1) {
    throw std::invalid_argument("QueueManager needs at least one worker");
  }
}

QueueManager::~QueueManager() {
  shutdown(std::chrono::milliseconds::zero(), {});
}

void QueueManager::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bStarted || _bStopping) return;
  _bStarted = true;

  _vWorkers.reserve(static_cast<size_t>(_qoOptions.iWorkers));
  for (int i = 0; i < _qoOptions.iWorkers; ++i) {
    _vWorkers.emplace_back([this](std::stop_token stToken) { workerLoop(stToken); });
  }
  common::Logger::get()->info("Queue manager started: {} workers, backlog bound {}",
                              _qoOptions.iWorkers, _qoOptions.iBacklog);
}

// ── Admission ──────────────────────────────────────────────────────────────

std::string QueueManager::submit(common::TransferJob tjJob) {
  if (tjJob.vItems.empty()) {
    throw common::ValidationError("empty_job", "Transfer job has no media items");
  }
  if (tjJob.iOwnerId <= 0) {
    throw common::ValidationError("missing_owner", "Transfer job has no owner");
  }

  std::string sJobId;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) {
      throw common::PoolClosedError("queue_closed", "Queue is shutting down");
    }
    if (static_cast<int>(_dqQueued.size()) >= _qoOptions.iBacklog) {
      throw common::QueueFullError(
          "queue_full", "Backlog is full (" + std::to_string(_qoOptions.iBacklog) + " jobs)");
    }

    auto spRec = std::make_shared<JobRecord>();
    spRec->tjJob = std::move(tjJob);
    auto& tj = spRec->tjJob;
    do {
      tj.sJobId = common::randomHex(8);
    } while (_mJobs.count(tj.sJobId) > 0);
    tj.iArrivalSeq = ++_iArrivalCounter;
    tj.state = JobState::Queued;
    tj.sDetail.clear();
    tj.tpSubmitted = std::chrono::system_clock::now();
    for (auto& mi : tj.vItems) {
      mi.status = common::ItemStatus::Pending;
      mi.sStagingPath.clear();
      mi.sFailureReason.clear();
      mi.sRemoteMessageRef.clear();
      mi.iTransferredBytes = 0;
    }

    sJobId = tj.sJobId;
    _mJobs.emplace(sJobId, spRec);
    enqueueLocked(spRec);
    emitLocked(sJobId, EventType::Queued,
               std::to_string(tj.vItems.size()) + " items, tier " + common::toString(tj.tier));

    common::Logger::get()->info("Job {} queued: owner={}, tier={}, items={}, backlog={}",
                                sJobId, tj.iOwnerId, common::toString(tj.tier),
                                tj.vItems.size(), _dqQueued.size());
  }
  _cv.notify_all();
  flushEvents();
  return sJobId;
}

void QueueManager::enqueueLocked(const std::shared_ptr<JobRecord>& spRec) {
  auto it = std::upper_bound(
      _dqQueued.begin(), _dqQueued.end(), spRec,
      [](const std::shared_ptr<JobRecord>& spA, const std::shared_ptr<JobRecord>& spB) {
        return dispatchesBefore(spA->tjJob, spB->tjJob);
      });
  _dqQueued.insert(it, spRec);
}

// ── Dispatch ───────────────────────────────────────────────────────────────

int QueueManager::ownerCeiling(const common::TransferJob& tjJob) const {
  try {
    return _apPolicy.maxActiveJobs(tjJob.iOwnerId, tjJob.tier);
  } catch (const std::exception& ex) {
    common::Logger::get()->warn("Access policy lookup failed for owner {}: {}; assuming 1",
                                tjJob.iOwnerId, ex.what());
    return 1;
  }
}

std::shared_ptr<QueueManager::JobRecord> QueueManager::dequeueNext() {
  if (_iActive >= _qoOptions.iWorkers) {
    return nullptr;
  }

  // One policy lookup per owner per pass
  std::unordered_map<int64_t, int> mCeilings;
  for (auto it = _dqQueued.begin(); it != _dqQueued.end(); ++it) {
    const auto& tj = (*it)->tjJob;
    auto itCeiling = mCeilings.find(tj.iOwnerId);
    if (itCeiling == mCeilings.end()) {
      itCeiling = mCeilings.emplace(tj.iOwnerId, ownerCeiling(tj)).first;
    }
    const int iCeiling = itCeiling->second;
    if (iCeiling > 0 && _mActivePerOwner[tj.iOwnerId] >= iCeiling) {
      continue;
    }

    auto spRec = *it;
    _dqQueued.erase(it);
    spRec->bDispatched = true;
    ++_iActive;
    ++_mActivePerOwner[tj.iOwnerId];
    return spRec;
  }
  return nullptr;
}

void QueueManager::releaseSlotLocked(JobRecord& rec) {
  if (!rec.bDispatched) return;
  rec.bDispatched = false;
  --_iActive;
  auto it = _mActivePerOwner.find(rec.tjJob.iOwnerId);
  if (it != _mActivePerOwner.end() && --it->second <= 0) {
    _mActivePerOwner.erase(it);
  }
  _cv.notify_all();
  _cvIdle.notify_all();
}

void QueueManager::workerLoop(std::stop_token stToken) {
  while (true) {
    std::shared_ptr<JobRecord> spRec;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this, &spRec, &stToken] {
        if (_bStopping || stToken.stop_requested()) return true;
        spRec = dequeueNext();
        return spRec != nullptr;
      });
      if (!spRec) return;
    }
    executeJob(spRec);
  }
}

void QueueManager::executeJob(const std::shared_ptr<JobRecord>& spRec) {
  auto spLog = common::Logger::get();
  const std::string sJobId = spRec->tjJob.sJobId;

  // ── Acquire a session ────────────────────────────────────────────────────
  std::optional<pool::SessionGuard> oGuard;
  try {
    oGuard.emplace(_spPool.acquire(_qoOptions.durAcquireTimeout));
  } catch (const common::PoolExhaustedError& ex) {
    {
      std::lock_guard<std::mutex> lock(_mtx);
      releaseSlotLocked(*spRec);
      if (spRec->ssCancel.stop_requested()) {
        finishLocked(*spRec, JobState::Cancelled, "cancelled before start");
      } else if (_bStopping) {
        finishLocked(*spRec, JobState::Cancelled, "shutdown in progress");
      } else if (++spRec->iAcquireAttempts <= _qoOptions.iAcquireRetries) {
        spLog->warn("Job {}: {} (attempt {}/{}), re-queued", sJobId, ex.what(),
                    spRec->iAcquireAttempts, _qoOptions.iAcquireRetries + 1);
        enqueueLocked(spRec);
        emitLocked(sJobId, EventType::Progress, "waiting for a free session");
      } else {
        finishLocked(*spRec, JobState::Failed, std::string("no session available: ") + ex.what());
      }
    }
    flushEvents();
    return;
  } catch (const common::PoolClosedError&) {
    {
      std::lock_guard<std::mutex> lock(_mtx);
      releaseSlotLocked(*spRec);
      finishLocked(*spRec, JobState::Cancelled, "shutdown in progress");
    }
    flushEvents();
    return;
  } catch (const std::exception& ex) {
    spLog->error("Job {}: session could not be established: {}", sJobId, ex.what());
    {
      std::lock_guard<std::mutex> lock(_mtx);
      releaseSlotLocked(*spRec);
      finishLocked(*spRec, JobState::Failed, std::string("session unavailable: ") + ex.what());
    }
    flushEvents();
    return;
  }

  // ── Run ──────────────────────────────────────────────────────────────────
  common::TransferJob tjWork;
  bool bStart = false;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (spRec->ssCancel.stop_requested()) {
      oGuard.reset();
      releaseSlotLocked(*spRec);
      finishLocked(*spRec, JobState::Cancelled, "cancelled before start");
    } else {
      spRec->tjJob.state = JobState::Running;
      spRec->tjJob.tpStarted = std::chrono::system_clock::now();
      spRec->tjJob.sDetail = "on " + oGuard->id();
      ++_iRunning;
      emitLocked(sJobId, EventType::Running, spRec->tjJob.sDetail);
      tjWork = spRec->tjJob;
      bStart = true;
    }
  }
  flushEvents();
  if (!bStart) return;

  spLog->info("Job {} running on {} ({} items)", sJobId, oGuard->id(), tjWork.vItems.size());

  common::GroupResult gr;
  std::string sError;
  try {
    gr = _mgsSequencer.run(
        tjWork, oGuard->client(), spRec->ssCancel.get_token(),
        [this, &sJobId](std::size_t, std::size_t, const std::string& sMessage) {
          {
            std::lock_guard<std::mutex> lock(_mtx);
            emitLocked(sJobId, EventType::Progress, sMessage);
          }
          flushEvents();
        });
  } catch (const std::exception& ex) {
    sError = ex.what();
    spLog->error("Job {} aborted: {}", sJobId, sError);
  }

  // Session goes back before the terminal transition
  if (gr.bSessionLost) {
    oGuard->invalidate();
  } else {
    oGuard->release();
  }
  oGuard.reset();

  {
    std::lock_guard<std::mutex> lock(_mtx);
    --_iRunning;
    spRec->tjJob.vItems = std::move(tjWork.vItems);
    releaseSlotLocked(*spRec);
    if (!sError.empty()) {
      finishLocked(*spRec, JobState::Failed, sError);
    } else {
      spRec->oResult = gr;
      finishLocked(*spRec, outcomeOf(gr), gr.summary());
    }
  }
  flushEvents();
}

// ── Cancellation & state ───────────────────────────────────────────────────

bool QueueManager::cancel(const std::string& sJobId) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mJobs.find(sJobId);
    if (it == _mJobs.end()) {
      throw common::NotFoundError("job_not_found", "Unknown job " + sJobId);
    }
    auto& spRec = it->second;
    if (common::isTerminal(spRec->tjJob.state)) {
      return false;
    }

    auto itQueued = std::find(_dqQueued.begin(), _dqQueued.end(), spRec);
    if (itQueued != _dqQueued.end()) {
      _dqQueued.erase(itQueued);
      finishLocked(*spRec, JobState::Cancelled, "cancelled by request");
      _cvIdle.notify_all();
    } else {
      spRec->ssCancel.request_stop();
      emitLocked(sJobId, EventType::Progress, "cancellation requested");
    }
  }
  common::Logger::get()->info("Job {}: cancellation requested", sJobId);
  flushEvents();
  return true;
}

void QueueManager::finishLocked(JobRecord& rec, JobState state, const std::string& sDetail) {
  auto& tj = rec.tjJob;
  if (common::isTerminal(tj.state)) return;

  tj.state = state;
  tj.sDetail = sDetail;
  tj.tpFinished = std::chrono::system_clock::now();
  emitLocked(tj.sJobId, eventFor(state), sDetail);

  auto spLog = common::Logger::get();
  if (state == JobState::Failed) {
    spLog->warn("Job {} failed: {}", tj.sJobId, sDetail);
  } else {
    spLog->info("Job {} {}: {}", tj.sJobId, common::toString(state), sDetail);
  }
}

std::optional<JobSnapshot> QueueManager::status(const std::string& sJobId) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _mJobs.find(sJobId);
  if (it == _mJobs.end()) {
    return std::nullopt;
  }
  return JobSnapshot{it->second->tjJob, it->second->oResult, it->second->iAcquireAttempts};
}

QueueStats QueueManager::stats() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return QueueStats{static_cast<int>(_dqQueued.size()), _iActive, _iRunning,
                    static_cast<int>(_mJobs.size())};
}

int QueueManager::pruneFinished() {
  std::lock_guard<std::mutex> lock(_mtx);
  const auto tpCutoff = std::chrono::system_clock::now() - _qoOptions.durRetention;
  int iPruned = 0;
  for (auto it = _mJobs.begin(); it != _mJobs.end();) {
    const auto& tj = it->second->tjJob;
    if (common::isTerminal(tj.state) && tj.tpFinished <= tpCutoff) {
      it = _mJobs.erase(it);
      ++iPruned;
    } else {
      ++it;
    }
  }
  return iPruned;
}

bool QueueManager::waitIdle(std::chrono::milliseconds durTimeout) {
  std::unique_lock<std::mutex> lock(_mtx);
  return _cvIdle.wait_for(lock, durTimeout,
                          [this] { return _dqQueued.empty() && _iActive == 0; });
}

// ── Events ─────────────────────────────────────────────────────────────────

int QueueManager::subscribe(StatusListener fnListener) {
  std::lock_guard<std::mutex> lock(_mtx);
  const int iHandle = _iNextListener++;
  _mListeners.emplace(iHandle, std::move(fnListener));
  return iHandle;
}

void QueueManager::unsubscribe(int iHandle) {
  std::lock_guard<std::mutex> lock(_mtx);
  _mListeners.erase(iHandle);
}

void QueueManager::emitLocked(const std::string& sJobId, EventType type, std::string sDetail) {
  _dqEvents.push_back(common::StatusEvent{++_iEventSeq, sJobId, type, std::move(sDetail),
                                          std::chrono::system_clock::now()});
}

void QueueManager::flushEvents() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bDelivering) return;  // the active deliverer drains what we queued
    _bDelivering = true;
  }

  auto spLog = common::Logger::get();
  while (true) {
    std::deque<common::StatusEvent> dqBatch;
    std::vector<StatusListener> vListeners;
    {
      std::lock_guard<std::mutex> lock(_mtx);
      if (_dqEvents.empty()) {
        _bDelivering = false;
        return;
      }
      dqBatch.swap(_dqEvents);
      for (const auto& [iHandle, fn] : _mListeners) {
        vListeners.push_back(fn);
      }
    }

    for (const auto& se : dqBatch) {
      for (const auto& fn : vListeners) {
        try {
          fn(se);
        } catch (const std::exception& ex) {
          spLog->error("Status listener failed on event {} for job {}: {}", se.iSequence,
                       se.sJobId, ex.what());
        }
      }
    }
  }
}

// ── Shutdown ───────────────────────────────────────────────────────────────

void QueueManager::shutdown(std::chrono::milliseconds durGrace,
                            const std::function<void()>& fnForceAbort) {
  auto spLog = common::Logger::get();
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) return;
    _bStopping = true;

    for (auto& spRec : _dqQueued) {
      finishLocked(*spRec, JobState::Cancelled, "shutdown in progress");
    }
    _dqQueued.clear();

    for (auto& [sJobId, spRec] : _mJobs) {
      if (spRec->bDispatched) {
        spRec->ssCancel.request_stop();
      }
    }
    spLog->info("Queue manager stopping: {} jobs in flight", _iActive);
  }
  _cv.notify_all();
  _cvIdle.notify_all();
  flushEvents();

  bool bDrained = false;
  {
    std::unique_lock<std::mutex> lock(_mtx);
    bDrained = _cvIdle.wait_for(lock, durGrace, [this] { return _iActive == 0; });
    if (!bDrained) {
      spLog->warn("Queue manager: {} jobs still in flight after {}ms grace; forcing abort",
                  _iActive, durGrace.count());
    }
  }
  if (!bDrained && fnForceAbort) {
    fnForceAbort();
  }

  for (auto& thWorker : _vWorkers) {
    thWorker.request_stop();
  }
  _cv.notify_all();
  for (auto& thWorker : _vWorkers) {
    if (thWorker.joinable()) {
      thWorker.join();
    }
  }
  _vWorkers.clear();
  flushEvents();
  spLog->info("Queue manager stopped");
}

}  // namespace relay::queue
