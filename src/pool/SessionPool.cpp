#include "pool/SessionPool.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <stdexcept>

namespace relay::pool {

using Clock = std::chrono::steady_clock;

// ── SessionGuard ───────────────────────────────────────────────────────────

SessionGuard::SessionGuard(SessionPool& spPool, std::shared_ptr<Session> spSession)
    : _pPool(&spPool), _spSession(std::move(spSession)) {}

SessionGuard::~SessionGuard() {
  release();
}

SessionGuard::SessionGuard(SessionGuard&& other) noexcept
    : _pPool(other._pPool), _spSession(std::move(other._spSession)) {
  other._pPool = nullptr;
}

SessionGuard& SessionGuard::operator=(SessionGuard&& other) noexcept {
  if (this != &other) {
    release();
    _pPool = other._pPool;
    _spSession = std::move(other._spSession);
    other._pPool = nullptr;
  }
  return *this;
}

platform::IPlatformClient& SessionGuard::client() {
  if (!_spSession) {
    throw std::logic_error("SessionGuard is empty");
  }
  return *_spSession->upClient;
}

const std::string& SessionGuard::id() const {
  static const std::string kEmpty;
  return _spSession ? _spSession->sId : kEmpty;
}

void SessionGuard::invalidate() {
  if (_spSession && _pPool) {
    _pPool->invalidate(_spSession);
  }
  _spSession.reset();
}

void SessionGuard::release() {
  if (_spSession && _pPool) {
    _pPool->release(_spSession);
  }
  _spSession.reset();
}

// ── SessionPool ────────────────────────────────────────────────────────────

SessionPool::SessionPool(platform::ISessionFactory& sfFactory, int iCapacity,
                         std::chrono::milliseconds durIdleTimeout)
    : _sfFactory(sfFactory), _iCapacity(iCapacity), _durIdleTimeout(durIdleTimeout) {
  if (_iCapacity < 1) {
    throw std::invalid_argument("Session pool capacity must be >= 1");
  }
  common::Logger::get()->info("Session pool ready: capacity={}, idle_timeout={}ms",
                              _iCapacity, _durIdleTimeout.count());
}

SessionPool::~SessionPool() {
  shutdown();
}

int SessionPool::occupiedSlots() const {
  return static_cast<int>(_vIdle.size() + _mInUse.size()) + _iCreating;
}

void SessionPool::closeSession(Session& ses, const char* pReason) {
  auto spLog = common::Logger::get();
  try {
    if (ses.upClient) {
      ses.upClient->logout();
    }
    spLog->info("Session {} closed ({})", ses.sId, pReason);
  } catch (const std::exception& ex) {
    spLog->warn("Session {} logout failed ({}): {}", ses.sId, pReason, ex.what());
  }
}

SessionGuard SessionPool::acquire(std::chrono::milliseconds durTimeout) {
  std::unique_lock<std::mutex> lock(_mtx);
  if (_bClosed) {
    throw common::PoolClosedError("pool_closed", "Session pool is shut down");
  }

  const uint64_t iTicket = _iNextTicket++;
  _dqWaiters.push_back(iTicket);

  const auto bReady = _cv.wait_for(lock, durTimeout, [this, iTicket] {
    return _bClosed || (_dqWaiters.front() == iTicket &&
                        (!_vIdle.empty() || occupiedSlots() < _iCapacity));
  });

  if (_bClosed || !bReady) {
    _dqWaiters.erase(std::find(_dqWaiters.begin(), _dqWaiters.end(), iTicket));
    _cv.notify_all();
    if (_bClosed) {
      throw common::PoolClosedError("pool_closed", "Session pool shut down while waiting");
    }
    throw common::PoolExhaustedError(
        "pool_exhausted", "No session available within " +
                              std::to_string(durTimeout.count()) + "ms (capacity " +
                              std::to_string(_iCapacity) + ")");
  }

  _dqWaiters.pop_front();
  _cv.notify_all();  // next waiter may now be at the front

  // Reuse the most recently used idle session
  if (!_vIdle.empty()) {
    auto spSession = std::move(_vIdle.back());
    _vIdle.pop_back();
    spSession->bInUse = true;
    spSession->tpLastUsed = Clock::now();
    _mInUse.emplace(spSession->sId, spSession);
    return SessionGuard(*this, std::move(spSession));
  }

  // Reserve a slot and connect outside the lock
  ++_iCreating;
  const std::string sId = "session-" + std::to_string(++_iSessionCounter);
  lock.unlock();

  std::unique_ptr<platform::IPlatformClient> upClient;
  try {
    upClient = _sfFactory.connect(sId);
  } catch (const std::exception& ex) {
    common::Logger::get()->error("Session {} could not be established: {}", sId, ex.what());
    lock.lock();
    --_iCreating;
    _cv.notify_all();
    throw;
  }

  auto spSession = std::make_shared<Session>();
  spSession->sId = sId;
  spSession->upClient = std::move(upClient);
  spSession->tpCreated = Clock::now();
  spSession->tpLastUsed = spSession->tpCreated;
  spSession->bInUse = true;

  lock.lock();
  --_iCreating;
  if (_bClosed) {
    _cv.notify_all();
    lock.unlock();
    closeSession(*spSession, "pool closed during connect");
    throw common::PoolClosedError("pool_closed", "Session pool shut down during connect");
  }
  _mInUse.emplace(sId, spSession);
  common::Logger::get()->info("Session {} established ({}/{} slots)", sId, occupiedSlots(),
                              _iCapacity);
  return SessionGuard(*this, std::move(spSession));
}

void SessionPool::release(const std::shared_ptr<Session>& spSession) {
  if (!spSession) return;

  std::unique_lock<std::mutex> lock(_mtx);
  auto it = _mInUse.find(spSession->sId);
  if (it == _mInUse.end() || it->second != spSession) {
    return;  // already idle or no longer pooled
  }
  _mInUse.erase(it);
  spSession->bInUse = false;
  spSession->tpLastUsed = Clock::now();

  if (_bClosed) {
    _cv.notify_all();
    lock.unlock();
    closeSession(*spSession, "pool shutdown");
    return;
  }

  _vIdle.push_back(spSession);
  _cv.notify_all();
}

void SessionPool::invalidate(const std::shared_ptr<Session>& spSession) {
  if (!spSession) return;

  {
    std::lock_guard<std::mutex> lock(_mtx);
    auto it = _mInUse.find(spSession->sId);
    if (it != _mInUse.end() && it->second == spSession) {
      _mInUse.erase(it);
    } else {
      auto itIdle = std::find(_vIdle.begin(), _vIdle.end(), spSession);
      if (itIdle == _vIdle.end()) return;
      _vIdle.erase(itIdle);
    }
    spSession->bInUse = false;
    _cv.notify_all();
  }

  common::Logger::get()->warn("Session {} invalidated; slot freed for re-authentication",
                              spSession->sId);
  closeSession(*spSession, "invalidated");
}

int SessionPool::evictIdle() {
  std::vector<std::shared_ptr<Session>> vEvicted;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    const auto tpNow = Clock::now();
    auto itKeep = std::stable_partition(
        _vIdle.begin(), _vIdle.end(), [this, tpNow](const std::shared_ptr<Session>& spSession) {
          return tpNow - spSession->tpLastUsed < _durIdleTimeout;
        });
    vEvicted.assign(std::make_move_iterator(itKeep), std::make_move_iterator(_vIdle.end()));
    _vIdle.erase(itKeep, _vIdle.end());
    if (!vEvicted.empty()) {
      _cv.notify_all();
    }
  }

  for (auto& spSession : vEvicted) {
    closeSession(*spSession, "idle timeout");
  }
  if (!vEvicted.empty()) {
    common::Logger::get()->info("Session pool: evicted {} idle sessions", vEvicted.size());
  }
  return static_cast<int>(vEvicted.size());
}

void SessionPool::shutdown() {
  std::vector<std::shared_ptr<Session>> vIdle;
  std::vector<std::shared_ptr<Session>> vBusy;
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bClosed) return;
    _bClosed = true;
    vIdle.swap(_vIdle);
    for (const auto& [sId, spSession] : _mInUse) {
      vBusy.push_back(spSession);
    }
    _cv.notify_all();
  }

  auto spLog = common::Logger::get();
  spLog->info("Session pool shutting down: {} idle, {} in use", vIdle.size(), vBusy.size());

  for (auto& spSession : vBusy) {
    spSession->upClient->abort();
  }
  for (auto& spSession : vIdle) {
    closeSession(*spSession, "pool shutdown");
  }
}

bool SessionPool::isClosed() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bClosed;
}

int SessionPool::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vIdle.size() + _mInUse.size());
}

int SessionPool::idleCount() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_vIdle.size());
}

int SessionPool::inUseCount() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return static_cast<int>(_mInUse.size());
}

}  // namespace relay::pool
