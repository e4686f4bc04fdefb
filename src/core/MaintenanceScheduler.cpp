#include "core/MaintenanceScheduler.hpp"

#include "common/Logger.hpp"

#include <algorithm>

namespace relay::core {

MaintenanceScheduler::MaintenanceScheduler() = default;

MaintenanceScheduler::~MaintenanceScheduler() {
  stop();
}

void MaintenanceScheduler::schedule(const std::string& sName,
                                    std::chrono::seconds durInterval,
                                    std::function<void()> fnTask) {
  std::lock_guard<std::mutex> lock(_mtx);
  _vTasks.push_back(Task{
      sName,
      durInterval,
      std::move(fnTask),
      std::chrono::steady_clock::now()  // run immediately on first pass
  });
}

bool MaintenanceScheduler::trigger(const std::string& sName) {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    const bool bKnown = std::any_of(_vTasks.begin(), _vTasks.end(),
                                    [&sName](const Task& task) { return task.sName == sName; });
    if (!bKnown) return false;
    _stTriggered.insert(sName);
  }
  _cv.notify_all();
  return true;
}

void MaintenanceScheduler::runTask(Task& task) {
  auto spLog = relay::common::Logger::get();
  try {
    task.fn();
  } catch (const std::exception& ex) {
    spLog->error("MaintenanceScheduler: task '{}' failed: {}", task.sName, ex.what());
  }
  task.tpNextRun = std::chrono::steady_clock::now() + task.durInterval;
}

void MaintenanceScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  _thread = std::jthread([this](std::stop_token stToken) {
    while (!stToken.stop_requested()) {
      std::set<std::string> stTriggered;
      {
        std::lock_guard<std::mutex> lock(_mtx);
        stTriggered.swap(_stTriggered);
      }

      auto tpNow = std::chrono::steady_clock::now();
      for (auto& task : _vTasks) {
        if (tpNow >= task.tpNextRun || stTriggered.count(task.sName) > 0) {
          runTask(task);
        }
      }

      // Find the next scheduled run time
      auto tpNextWake = std::chrono::steady_clock::now() + std::chrono::hours(1);
      for (const auto& task : _vTasks) {
        tpNextWake = std::min(tpNextWake, task.tpNextRun);
      }

      // Sleep until next task is due, a trigger arrives, or stop is requested
      std::unique_lock<std::mutex> ulock(_mtx);
      _cv.wait_until(ulock, tpNextWake, [this, &stToken]() {
        return stToken.stop_requested() || !_stTriggered.empty();
      });
    }
  });
}

void MaintenanceScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
    _thread.request_stop();
  }
  _cv.notify_all();

  if (_thread.joinable()) {
    _thread.join();
  }
}

}  // namespace relay::core
