#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace relay::core {

/// Runs periodic background tasks on configurable intervals.
/// A task can also be run out of schedule with trigger().
/// Class abbreviation: ms
class MaintenanceScheduler {
 public:
  MaintenanceScheduler();
  ~MaintenanceScheduler();

  /// Register a task. Must be called before start().
  void schedule(const std::string& sName, std::chrono::seconds durInterval,
                std::function<void()> fnTask);
  void start();
  void stop();

  /// Run the named task as soon as the scheduler thread is free, then resume
  /// its normal interval. Returns false if no such task is scheduled.
  bool trigger(const std::string& sName);

 private:
  struct Task {
    std::string sName;
    std::chrono::seconds durInterval;
    std::function<void()> fn;
    std::chrono::steady_clock::time_point tpNextRun;
  };

  /// Invoke a task, logging anything it throws.
  static void runTask(Task& task);

  std::vector<Task> _vTasks;
  std::set<std::string> _stTriggered;
  std::jthread _thread;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bRunning = false;
};

}  // namespace relay::core
