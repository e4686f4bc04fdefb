#pragma once

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace relay::transfer {

/// Registry of staging paths currently owned by an in-flight media item.
/// Anything in the staging directory that is not in the ledger is a reaper candidate.
/// Class abbreviation: rl
class ResourceLedger {
 public:
  void add(const std::filesystem::path& path);
  void remove(const std::filesystem::path& path);
  bool contains(const std::filesystem::path& path) const;
  std::size_t size() const;
  std::vector<std::string> snapshot() const;

 private:
  std::unordered_set<std::string> _stPaths;
  mutable std::mutex _mtx;
};

class StagingArea;

/// RAII handle for one item's staging path.
/// The file is deleted and the ledger entry dropped on destruction, on every exit path.
/// Class abbreviation: sf
class StagingFile {
 public:
  StagingFile(StagingArea& saArea, std::filesystem::path path);
  ~StagingFile();

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;
  StagingFile(StagingFile&& other) noexcept;
  StagingFile& operator=(StagingFile&& other) noexcept;

  const std::filesystem::path& path() const { return _path; }

  /// Delete the file and release the ledger entry. Deleting a missing file
  /// succeeds. Idempotent. Returns false if the file could not be removed;
  /// the path is then left to the reaper.
  bool remove();

 private:
  StagingArea* _pArea;
  std::filesystem::path _path;
};

/// Directory holding per-item staging files.
/// Class abbreviation: sa
class StagingArea {
 public:
  /// Creates pathRoot if needed. Throws std::runtime_error if it cannot.
  StagingArea(std::filesystem::path pathRoot, ResourceLedger& rlLedger);

  /// Reserve a unique staging path for an item of sJobId and register it in the ledger.
  /// sHint (usually the remote reference) contributes a sanitized file name suffix.
  StagingFile allocate(const std::string& sJobId, const std::string& sHint);

  const std::filesystem::path& root() const { return _pathRoot; }
  ResourceLedger& ledger() { return _rlLedger; }

 private:
  std::filesystem::path _pathRoot;
  ResourceLedger& _rlLedger;
};

}  // namespace relay::transfer
