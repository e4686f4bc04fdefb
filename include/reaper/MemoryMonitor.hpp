#pragma once

#include <cstdint>
#include <functional>

namespace relay::reaper {

/// Samples process memory and signals pressure above a threshold.
/// Class abbreviation: mm
class MemoryMonitor {
 public:
  using SamplerFn = std::function<int64_t()>;
  using PressureFn = std::function<void(int64_t)>;

  /// fnSampler defaults to residentBytes().
  MemoryMonitor(int64_t iLimitBytes, PressureFn fnOnPressure, SamplerFn fnSampler = {});

  /// Take one sample; invokes the pressure callback and returns true when over the limit.
  bool check();

  /// Resident set size of this process from /proc/self/statm, or -1 if unavailable.
  static int64_t residentBytes();

 private:
  int64_t _iLimitBytes;
  PressureFn _fnOnPressure;
  SamplerFn _fnSampler;
  bool _bUnderPressure = false;
};

}  // namespace relay::reaper
