#include "platform/LocalPlatform.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace relay::platform {

namespace {
constexpr size_t kChunkBytes = 512 * 1024;

/// Resolve sRelative under pathRoot, rejecting anything that escapes it.
fs::path resolveInside(const fs::path& pathRoot, const std::string& sRelative) {
  if (sRelative.empty()) {
    throw common::TransferFailedError("invalid_reference", "Empty remote reference");
  }
  const fs::path pathRel = fs::path(sRelative).lexically_normal();
  if (pathRel.is_absolute() || pathRel.empty() || *pathRel.begin() == "..") {
    throw common::TransferFailedError("invalid_reference",
                                      "Reference escapes platform root: " + sRelative);
  }
  return pathRoot / pathRel;
}
}  // namespace

// ── LocalPlatformClient ────────────────────────────────────────────────────

LocalPlatformClient::LocalPlatformClient(std::string sSessionId, fs::path pathSource,
                                         fs::path pathDest)
    : _sSessionId(std::move(sSessionId)),
      _pathSource(std::move(pathSource)),
      _pathDest(std::move(pathDest)) {}

LocalPlatformClient::~LocalPlatformClient() = default;

void LocalPlatformClient::ensureUsable() const {
  if (_bLoggedOut.load()) {
    throw common::SessionInvalidError("session_logged_out",
                                      "Session " + _sSessionId + " is logged out");
  }
  if (_bAborted.load()) {
    throw common::SessionInvalidError("session_aborted",
                                      "Session " + _sSessionId + " was aborted");
  }
}

int64_t LocalPlatformClient::copyChunked(const fs::path& pathFrom, const fs::path& pathTo,
                                         const ProgressFn& fnProgress) {
  std::error_code ec;
  const auto iTotal = static_cast<int64_t>(fs::file_size(pathFrom, ec));
  if (ec) {
    throw common::TransferFailedError("source_unreadable",
                                      "Cannot stat " + pathFrom.string() + ": " + ec.message());
  }

  std::ifstream ifs(pathFrom, std::ios::binary);
  if (!ifs.is_open()) {
    throw common::TransferFailedError("source_unreadable", "Cannot open " + pathFrom.string());
  }
  std::ofstream ofs(pathTo, std::ios::binary | std::ios::trunc);
  if (!ofs.is_open()) {
    throw common::TransferFailedError("target_unwritable", "Cannot open " + pathTo.string());
  }

  std::vector<char> vBuf(kChunkBytes);
  int64_t iDone = 0;
  while (ifs) {
    ensureUsable();
    ifs.read(vBuf.data(), static_cast<std::streamsize>(vBuf.size()));
    const auto iRead = ifs.gcount();
    if (iRead <= 0) break;
    ofs.write(vBuf.data(), iRead);
    if (!ofs) {
      throw common::TransferFailedError("target_unwritable",
                                        "Write failed for " + pathTo.string());
    }
    iDone += iRead;
    if (fnProgress) fnProgress(iDone, iTotal);
  }
  if (ifs.bad()) {
    throw common::TransferFailedError("source_unreadable", "Read failed for " + pathFrom.string());
  }
  return iDone;
}

int64_t LocalPlatformClient::download(const std::string& sRemoteRef,
                                      const std::string& sDestPath, int /*iConnections*/,
                                      const ProgressFn& fnProgress) {
  ensureUsable();
  const fs::path pathFrom = resolveInside(_pathSource, sRemoteRef);
  if (!fs::is_regular_file(pathFrom)) {
    throw common::TransferFailedError("remote_not_found", "No such media: " + sRemoteRef);
  }
  return copyChunked(pathFrom, sDestPath, fnProgress);
}

std::string LocalPlatformClient::upload(const std::string& sLocalPath,
                                        const std::string& sTarget, int /*iConnections*/,
                                        const ProgressFn& fnProgress) {
  ensureUsable();
  const fs::path pathDir = resolveInside(_pathDest, sTarget);
  std::error_code ec;
  fs::create_directories(pathDir, ec);
  if (ec) {
    throw common::TransferFailedError("target_unwritable",
                                      "Cannot create " + pathDir.string() + ": " + ec.message());
  }

  const fs::path pathName = fs::path(sLocalPath).filename();
  copyChunked(sLocalPath, pathDir / pathName, fnProgress);
  return (fs::path(sTarget) / pathName).generic_string();
}

void LocalPlatformClient::abort() {
  _bAborted.store(true);
}

void LocalPlatformClient::logout() {
  if (!_bLoggedOut.exchange(true)) {
    common::Logger::get()->debug("Loopback session {} logged out", _sSessionId);
  }
}

// ── LocalSessionFactory ────────────────────────────────────────────────────

LocalSessionFactory::LocalSessionFactory(fs::path pathSource, fs::path pathDest,
                                         std::string sCredential)
    : _pathSource(std::move(pathSource)),
      _pathDest(std::move(pathDest)),
      _sCredential(std::move(sCredential)) {}

LocalSessionFactory::~LocalSessionFactory() {
  OPENSSL_cleanse(_sCredential.data(), _sCredential.size());
}

std::unique_ptr<IPlatformClient> LocalSessionFactory::connect(const std::string& sSessionId) {
  if (_sCredential.empty()) {
    throw common::SessionInvalidError("auth_failed", "No platform credential configured");
  }
  if (!fs::is_directory(_pathSource)) {
    throw common::SessionInvalidError("auth_failed",
                                      "Source directory missing: " + _pathSource.string());
  }
  common::Logger::get()->debug("Loopback session {} connected", sSessionId);
  return std::make_unique<LocalPlatformClient>(sSessionId, _pathSource, _pathDest);
}

}  // namespace relay::platform
