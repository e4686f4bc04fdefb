#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "common/Types.hpp"

namespace relay::pool {
class SessionPool;
}

namespace relay::transfer {
class MediaGroupSequencer;
}

namespace relay::queue {

class IAccessPolicy;

/// Class abbreviation: qo
struct QueueOptions {
  int iBacklog = 100;
  int iWorkers = 3;  // global running ceiling; equals the session pool capacity
  std::chrono::milliseconds durAcquireTimeout{60000};
  int iAcquireRetries = 2;
  std::chrono::milliseconds durRetention{3600000};
};

/// Point-in-time copy of a job and, once finished, its group result.
/// Class abbreviation: js
struct JobSnapshot {
  common::TransferJob tjJob;
  std::optional<common::GroupResult> oResult;
  int iAcquireAttempts = 0;
};

/// Class abbreviation: qs
struct QueueStats {
  int iQueued = 0;
  int iActive = 0;   // dispatched to a worker (acquiring or running)
  int iRunning = 0;  // holding a session
  int iTracked = 0;  // records retained, including finished ones
};

using StatusListener = std::function<void(const common::StatusEvent&)>;

/// Admits transfer jobs under a backlog bound and dispatches them to a fixed
/// set of workers, one session per running job.
///
/// Dispatch picks the first queued job, in dispatchesBefore() order, whose
/// owner is below the per-user ceiling from IAccessPolicy. Status events are
/// delivered to subscribers in emission order.
/// Class abbreviation: qm
class QueueManager {
 public:
  QueueManager(pool::SessionPool& spPool, transfer::MediaGroupSequencer& mgsSequencer,
               const IAccessPolicy& apPolicy, QueueOptions qoOptions);
  ~QueueManager();

  QueueManager(const QueueManager&) = delete;
  QueueManager& operator=(const QueueManager&) = delete;

  /// Spawn the worker threads. Idempotent.
  void start();

  /// Admit a job and return its id. Throws ValidationError for malformed jobs,
  /// QueueFullError when the backlog is at its bound (nothing is modified) and
  /// PoolClosedError once shutdown has begun.
  std::string submit(common::TransferJob tjJob);

  /// Cancel a job. Queued jobs become Cancelled immediately; running jobs stop
  /// before their next item. Returns false for already finished jobs.
  /// Throws NotFoundError for unknown ids.
  bool cancel(const std::string& sJobId);

  std::optional<JobSnapshot> status(const std::string& sJobId) const;
  QueueStats stats() const;

  /// Register a status listener. Returns a handle for unsubscribe().
  int subscribe(StatusListener fnListener);
  void unsubscribe(int iHandle);

  /// Drop records of jobs that finished more than the retention period ago.
  int pruneFinished();

  /// Block until nothing is queued or active, or durTimeout elapses.
  bool waitIdle(std::chrono::milliseconds durTimeout);

  /// Stop admitting, cancel queued jobs and ask running jobs to stop after their
  /// current item. If they have not finished within durGrace, fnForceAbort is
  /// invoked to interrupt in-flight transfers. Workers are joined before return.
  void shutdown(std::chrono::milliseconds durGrace, const std::function<void()>& fnForceAbort);

 private:
  struct JobRecord {
    common::TransferJob tjJob;
    std::stop_source ssCancel;
    std::optional<common::GroupResult> oResult;
    int iAcquireAttempts = 0;
    bool bDispatched = false;
  };

  void workerLoop(std::stop_token stToken);
  void executeJob(const std::shared_ptr<JobRecord>& spRec);

  /// Remove and return the next eligible queued job, or nullptr. Caller holds _mtx.
  std::shared_ptr<JobRecord> dequeueNext();

  /// Per-owner ceiling lookup; 0 = unlimited. A throwing policy yields 1. Caller holds _mtx.
  int ownerCeiling(const common::TransferJob& tjJob) const;

  /// Insert into the queue in dispatch order. Caller holds _mtx.
  void enqueueLocked(const std::shared_ptr<JobRecord>& spRec);

  /// Release the dispatch slot held by a record. Caller holds _mtx.
  void releaseSlotLocked(JobRecord& rec);

  /// Move a record to a terminal state and emit its event. Caller holds _mtx.
  void finishLocked(JobRecord& rec, common::JobState state, const std::string& sDetail);

  /// Queue an event for delivery. Caller holds _mtx.
  void emitLocked(const std::string& sJobId, common::EventType type, std::string sDetail);

  /// Deliver pending events outside _mtx. Only one thread delivers at a time.
  void flushEvents();

  pool::SessionPool& _spPool;
  transfer::MediaGroupSequencer& _mgsSequencer;
  const IAccessPolicy& _apPolicy;
  QueueOptions _qoOptions;

  std::unordered_map<std::string, std::shared_ptr<JobRecord>> _mJobs;
  std::deque<std::shared_ptr<JobRecord>> _dqQueued;  // dispatch order
  std::unordered_map<int64_t, int> _mActivePerOwner;
  int _iActive = 0;
  int _iRunning = 0;
  uint64_t _iArrivalCounter = 0;
  bool _bStarted = false;
  bool _bStopping = false;

  std::map<int, StatusListener> _mListeners;
  int _iNextListener = 1;
  std::deque<common::StatusEvent> _dqEvents;
  uint64_t _iEventSeq = 0;
  bool _bDelivering = false;

  std::vector<std::jthread> _vWorkers;
  mutable std::mutex _mtx;
  std::condition_variable _cv;      // work available / stopping
  std::condition_variable _cvIdle;  // active count dropped
};

}  // namespace relay::queue
