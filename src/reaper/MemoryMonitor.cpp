#include "reaper/MemoryMonitor.hpp"

#include "common/Logger.hpp"

#include <unistd.h>

#include <fstream>

namespace relay::reaper {

MemoryMonitor::MemoryMonitor(int64_t iLimitBytes, PressureFn fnOnPressure, SamplerFn fnSampler)
    : _iLimitBytes(iLimitBytes),
      _fnOnPressure(std::move(fnOnPressure)),
      _fnSampler(fnSampler ? std::move(fnSampler) : SamplerFn(&MemoryMonitor::residentBytes)) {}

bool MemoryMonitor::check() {
  const int64_t iResident = _fnSampler();
  if (iResident < 0 || iResident <= _iLimitBytes) {
    if (_bUnderPressure) {
      common::Logger::get()->info("Memory pressure cleared: {} MB resident",
                                  iResident / (1024 * 1024));
    }
    _bUnderPressure = false;
    return false;
  }

  if (!_bUnderPressure) {
    common::Logger::get()->warn("Memory pressure: {} MB resident exceeds {} MB limit",
                                iResident / (1024 * 1024), _iLimitBytes / (1024 * 1024));
  }
  _bUnderPressure = true;
  if (_fnOnPressure) {
    _fnOnPressure(iResident);
  }
  return true;
}

int64_t MemoryMonitor::residentBytes() {
  std::ifstream ifs("/proc/self/statm");
  int64_t iTotalPages = 0;
  int64_t iResidentPages = 0;
  if (!(ifs >> iTotalPages >> iResidentPages)) {
    return -1;
  }
  const long lPageSize = sysconf(_SC_PAGESIZE);
  return lPageSize > 0 ? iResidentPages * lPageSize : -1;
}

}  // namespace relay::reaper
