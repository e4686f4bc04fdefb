#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "platform/IPlatformClient.hpp"

namespace relay::pool {

class SessionPool;

/// One authenticated platform session owned by the pool.
/// Class abbreviation: ses
struct Session {
  std::string sId;
  std::unique_ptr<platform::IPlatformClient> upClient;
  std::chrono::steady_clock::time_point tpCreated;
  std::chrono::steady_clock::time_point tpLastUsed;
  bool bInUse = false;
};

/// RAII guard for a checked-out session.
/// Returns the session to the pool on destruction.
/// Class abbreviation: sg
class SessionGuard {
 public:
  SessionGuard(SessionPool& spPool, std::shared_ptr<Session> spSession);
  ~SessionGuard();

  SessionGuard(const SessionGuard&) = delete;
  SessionGuard& operator=(const SessionGuard&) = delete;
  SessionGuard(SessionGuard&& other) noexcept;
  SessionGuard& operator=(SessionGuard&& other) noexcept;

  platform::IPlatformClient& client();
  const std::string& id() const;

  /// Report the session unusable. It is logged out and its slot freed instead
  /// of returning to the idle registry. The guard is empty afterwards.
  void invalidate();

  /// Return the session early. Idempotent.
  void release();

 private:
  SessionPool* _pPool;
  std::shared_ptr<Session> _spSession;
};

/// Bounded pool of authenticated platform sessions.
/// Sessions are created lazily up to the capacity, reused across jobs and
/// evicted once idle for longer than the idle timeout.
/// Acquisition is FIFO: a waiter is served only when every earlier waiter has been.
/// Thread-safe via std::mutex + std::condition_variable.
/// Class abbreviation: sp
class SessionPool {
 public:
  SessionPool(platform::ISessionFactory& sfFactory, int iCapacity,
              std::chrono::milliseconds durIdleTimeout);
  ~SessionPool();

  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  /// Check out a session, creating one if below capacity. Blocks up to durTimeout.
  /// Throws PoolExhaustedError on timeout, PoolClosedError after shutdown().
  /// Platform errors from session creation propagate unchanged.
  SessionGuard acquire(std::chrono::milliseconds durTimeout);

  /// Return a session to the idle registry. No-op for sessions that are not checked out.
  void release(const std::shared_ptr<Session>& spSession);

  /// Remove a checked-out session after it was reported invalid and log it out.
  void invalidate(const std::shared_ptr<Session>& spSession);

  /// Log out and remove idle sessions unused for at least the idle timeout.
  /// Sessions in use are never evicted. Returns the number evicted.
  int evictIdle();

  /// Refuse new acquires, fail pending ones with PoolClosedError, close idle
  /// sessions and abort in-flight transfers on checked-out ones (those are
  /// closed when they come back). Idempotent.
  void shutdown();

  bool isClosed() const;
  int capacity() const { return _iCapacity; }
  int size() const;
  int idleCount() const;
  int inUseCount() const;

 private:
  /// Sessions existing or being created. Caller holds _mtx.
  int occupiedSlots() const;

  /// Log out a session's client; failures are logged, never thrown.
  static void closeSession(Session& ses, const char* pReason);

  platform::ISessionFactory& _sfFactory;
  int _iCapacity;
  std::chrono::milliseconds _durIdleTimeout;

  std::vector<std::shared_ptr<Session>> _vIdle;  // back() = most recently used
  std::unordered_map<std::string, std::shared_ptr<Session>> _mInUse;
  int _iCreating = 0;
  std::deque<uint64_t> _dqWaiters;
  uint64_t _iNextTicket = 0;
  uint64_t _iSessionCounter = 0;
  bool _bClosed = false;

  mutable std::mutex _mtx;
  std::condition_variable _cv;
};

}  // namespace relay::pool
