#include "transfer/StagingArea.hpp"

#include "common/Logger.hpp"
#include "common/RandomId.hpp"

#include <cctype>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace relay::transfer {

namespace {
constexpr size_t kMaxHintChars = 64;

std::string sanitizeHint(const std::string& sHint) {
  std::string sName = fs::path(sHint).filename().string();
  std::string sResult;
  for (char c : sName) {
    if (sResult.size() >= kMaxHintChars) break;
    const auto uc = static_cast<unsigned char>(c);
    sResult.push_back(std::isalnum(uc) || c == '.' || c == '_' || c == '-' ? c : '_');
  }
  return sResult.empty() ? "media" : sResult;
}
}  // namespace

// ── ResourceLedger ─────────────────────────────────────────────────────────

void ResourceLedger::add(const fs::path& path) {
  std::lock_guard<std::mutex> lock(_mtx);
  _stPaths.insert(path.lexically_normal().string());
}

void ResourceLedger::remove(const fs::path& path) {
  std::lock_guard<std::mutex> lock(_mtx);
  _stPaths.erase(path.lexically_normal().string());
}

bool ResourceLedger::contains(const fs::path& path) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _stPaths.count(path.lexically_normal().string()) > 0;
}

std::size_t ResourceLedger::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _stPaths.size();
}

std::vector<std::string> ResourceLedger::snapshot() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return {_stPaths.begin(), _stPaths.end()};
}

// ── StagingFile ────────────────────────────────────────────────────────────

StagingFile::StagingFile(StagingArea& saArea, fs::path path)
    : _pArea(&saArea), _path(std::move(path)) {}

StagingFile::~StagingFile() {
  remove();
}

StagingFile::StagingFile(StagingFile&& other) noexcept
    : _pArea(other._pArea), _path(std::move(other._path)) {
  other._pArea = nullptr;
}

StagingFile& StagingFile::operator=(StagingFile&& other) noexcept {
  if (this != &other) {
    remove();
    _pArea = other._pArea;
    _path = std::move(other._path);
    other._pArea = nullptr;
  }
  return *this;
}

bool StagingFile::remove() {
  if (!_pArea) return true;

  std::error_code ec;
  fs::remove(_path, ec);  // false without error when already gone
  _pArea->ledger().remove(_path);
  _pArea = nullptr;

  if (ec) {
    common::Logger::get()->error("Failed to delete staging file {}: {}", _path.string(),
                                 ec.message());
    return false;
  }
  return true;
}

// ── StagingArea ────────────────────────────────────────────────────────────

StagingArea::StagingArea(fs::path pathRoot, ResourceLedger& rlLedger)
    : _pathRoot(fs::absolute(pathRoot).lexically_normal()), _rlLedger(rlLedger) {
  std::error_code ec;
  fs::create_directories(_pathRoot, ec);
  if (ec) {
    throw std::runtime_error("Cannot create staging directory " + _pathRoot.string() + ": " +
                             ec.message());
  }
  common::Logger::get()->info("Staging area at {}", _pathRoot.string());
}

StagingFile StagingArea::allocate(const std::string& sJobId, const std::string& sHint) {
  const fs::path path =
      _pathRoot / (sJobId + "-" + common::randomHex(6) + "-" + sanitizeHint(sHint));
  _rlLedger.add(path);
  return StagingFile(*this, path);
}

}  // namespace relay::transfer
