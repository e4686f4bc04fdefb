#include "reaper/ResourceReaper.hpp"

#include "common/Logger.hpp"
#include "pool/SessionPool.hpp"
#include "transfer/StagingArea.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace relay::reaper {

ResourceReaper::ResourceReaper(fs::path pathStaging, const transfer::ResourceLedger& rlLedger,
                               pool::SessionPool& spPool, std::chrono::seconds durGrace)
    : _pathStaging(fs::absolute(pathStaging).lexically_normal()),
      _rlLedger(rlLedger),
      _spPool(spPool),
      _durGrace(durGrace) {}

ResourceReaper::~ResourceReaper() = default;

SweepReport ResourceReaper::sweep() {
  return sweep(_durGrace);
}

SweepReport ResourceReaper::sweep(std::chrono::seconds durGrace) {
  auto spLog = common::Logger::get();
  SweepReport srReport;

  try {
    sweepFiles(durGrace, srReport);
  } catch (const std::exception& ex) {
    spLog->error("Reaper: staging scan aborted: {}", ex.what());
  }

  try {
    srReport.iSessionsEvicted = _spPool.evictIdle();
  } catch (const std::exception& ex) {
    spLog->error("Reaper: idle session eviction failed: {}", ex.what());
  }

  if (srReport.iRemoved > 0 || srReport.iFailed > 0 || srReport.iSessionsEvicted > 0) {
    spLog->info("Reaper: scanned {}, removed {} orphans, {} failures, evicted {} sessions",
                srReport.iScanned, srReport.iRemoved, srReport.iFailed,
                srReport.iSessionsEvicted);
  } else {
    spLog->debug("Reaper: scanned {} staging entries, nothing to reclaim", srReport.iScanned);
  }
  return srReport;
}

void ResourceReaper::sweepFiles(std::chrono::seconds durGrace, SweepReport& srReport) {
  auto spLog = common::Logger::get();

  std::error_code ec;
  fs::directory_iterator itDir(_pathStaging, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    if (ec != std::errc::no_such_file_or_directory) {
      spLog->warn("Reaper: cannot list {}: {}", _pathStaging.string(), ec.message());
    }
    return;
  }

  // Collect first; entries may appear or vanish while we list
  std::vector<fs::path> vCandidates;
  const auto tpNow = fs::file_time_type::clock::now();
  for (; itDir != fs::directory_iterator(); itDir.increment(ec)) {
    if (ec) {
      spLog->warn("Reaper: listing {} interrupted: {}", _pathStaging.string(), ec.message());
      break;
    }
    ++srReport.iScanned;
    const fs::path path = itDir->path();
    if (_rlLedger.contains(path)) {
      continue;
    }

    std::error_code ecTime;
    const auto ftWrite = fs::last_write_time(path, ecTime);
    if (ecTime) {
      continue;  // vanished since listing; retried next sweep otherwise
    }
    if (tpNow - ftWrite >= durGrace) {
      vCandidates.push_back(path);
    }
  }

  for (const auto& path : vCandidates) {
    if (_rlLedger.contains(path)) {
      continue;  // claimed after the scan
    }
    std::error_code ecRemove;
    fs::remove_all(path, ecRemove);
    if (ecRemove && ecRemove != std::errc::no_such_file_or_directory) {
      ++srReport.iFailed;
      spLog->warn("Reaper: failed to delete {}: {}", path.string(), ecRemove.message());
      continue;
    }
    ++srReport.iRemoved;
    spLog->debug("Reaper: deleted orphan {}", path.string());
  }
}

}  // namespace relay::reaper
