#include "common/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace relay::common {

namespace {

void requireRange(const char* pVarName, int64_t iValue, int64_t iMin, int64_t iMax) {
  if (iValue < iMin || iValue > iMax) {
    throw std::runtime_error(std::string(pVarName) + " must be in [" + std::to_string(iMin) +
                             ", " + std::to_string(iMax) + "] (got " +
                             std::to_string(iValue) + ")");
  }
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoi(sValue);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

int64_t Config::getEnvInt64(const char* pVarName, int64_t iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  try {
    return std::stoll(sValue);
  } catch (const std::exception&) {
    throw std::runtime_error(
        std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw std::runtime_error(
        std::string("Required secret not set: neither ") + pVarName + " nor " + sFileVar +
        " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw std::runtime_error(
        std::string("Cannot open secret file specified by ") + sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw std::runtime_error(
        std::string("Secret file is empty: ") + sFilePath + " (from " + sFileVar + ")");
  }

  return sValue;
}

bool Config::detectConstrainedHost() {
  return !getEnv("RENDER").empty() || !getEnv("RENDER_EXTERNAL_URL").empty() ||
         !getEnv("REPLIT_DEPLOYMENT").empty() || !getEnv("REPL_ID").empty();
}

Config Config::load() {
  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sSessionSecret = loadSecret("RELAY_SESSION_SECRET");

  // ── Staging ────────────────────────────────────────────────────────────
  const std::string sStagingDir = getEnv("RELAY_STAGING_DIR");
  if (!sStagingDir.empty()) {
    cfg.sStagingDir = sStagingDir;
  }
  cfg.iMaxItemBytes = getEnvInt64("RELAY_MAX_ITEM_BYTES", cfg.iMaxItemBytes);

  // ── Session pool ───────────────────────────────────────────────────────
  cfg.iPoolSize = getEnvInt("RELAY_POOL_SIZE", 3);
  cfg.iSessionIdleTimeoutSeconds = getEnvInt("RELAY_SESSION_IDLE_TIMEOUT_SECONDS", 1800);
  cfg.iAcquireTimeoutSeconds = getEnvInt("RELAY_ACQUIRE_TIMEOUT_SECONDS", 60);
  cfg.iAcquireRetries = getEnvInt("RELAY_ACQUIRE_RETRIES", 2);

  // ── Queue ──────────────────────────────────────────────────────────────
  cfg.iQueueBacklog = getEnvInt("RELAY_QUEUE_BACKLOG", 100);
  cfg.iFreeActiveJobs = getEnvInt("RELAY_FREE_ACTIVE_JOBS", 1);
  cfg.iPremiumActiveJobs = getEnvInt("RELAY_PREMIUM_ACTIVE_JOBS", 0);
  cfg.iJobRetentionSeconds = getEnvInt("RELAY_JOB_RETENTION_SECONDS", 3600);
  cfg.iShutdownGraceSeconds = getEnvInt("RELAY_SHUTDOWN_GRACE_SECONDS", 30);

  // ── Reaper ─────────────────────────────────────────────────────────────
  cfg.iReaperIntervalSeconds = getEnvInt("RELAY_REAPER_INTERVAL_SECONDS", 300);
  cfg.iOrphanGraceSeconds = getEnvInt("RELAY_ORPHAN_GRACE_SECONDS", 300);

  // ── Memory monitor ─────────────────────────────────────────────────────
  cfg.iMemoryLimitMb = getEnvInt("RELAY_MEMORY_LIMIT_MB", 0);
  cfg.iMemoryCheckIntervalSeconds = getEnvInt("RELAY_MEMORY_CHECK_INTERVAL_SECONDS", 15);

  // ── Transfer tuning ────────────────────────────────────────────────────
  // Each parallel connection holds ~5-10 MB of buffers.
  cfg.bConstrainedHost = detectConstrainedHost();
  cfg.iMaxDownloadConnections =
      getEnvInt("RELAY_MAX_DOWNLOAD_CONNECTIONS", cfg.bConstrainedHost ? 12 : 16);
  cfg.iMaxUploadConnections =
      getEnvInt("RELAY_MAX_UPLOAD_CONNECTIONS", cfg.bConstrainedHost ? 8 : 10);

  // ── Loopback platform ──────────────────────────────────────────────────
  const std::string sSourceDir = getEnv("RELAY_LOCAL_SOURCE_DIR");
  if (!sSourceDir.empty()) {
    cfg.oLocalSourceDir = sSourceDir;
  }
  const std::string sDestDir = getEnv("RELAY_LOCAL_DEST_DIR");
  if (!sDestDir.empty()) {
    cfg.oLocalDestDir = sDestDir;
  }

  // ── Logging ────────────────────────────────────────────────────────────
  const std::string sLogLevel = getEnv("RELAY_LOG_LEVEL");
  if (!sLogLevel.empty()) {
    cfg.sLogLevel = sLogLevel;
  }

  // ── Validation ─────────────────────────────────────────────────────────
  requireRange("RELAY_POOL_SIZE", cfg.iPoolSize, 1, 32);
  requireRange("RELAY_SESSION_IDLE_TIMEOUT_SECONDS", cfg.iSessionIdleTimeoutSeconds, 1,
               86400 * 7);
  requireRange("RELAY_ACQUIRE_TIMEOUT_SECONDS", cfg.iAcquireTimeoutSeconds, 1, 3600);
  requireRange("RELAY_ACQUIRE_RETRIES", cfg.iAcquireRetries, 0, 100);
  requireRange("RELAY_QUEUE_BACKLOG", cfg.iQueueBacklog, 1, 1000000);
  requireRange("RELAY_FREE_ACTIVE_JOBS", cfg.iFreeActiveJobs, 0, 1000);
  requireRange("RELAY_PREMIUM_ACTIVE_JOBS", cfg.iPremiumActiveJobs, 0, 1000);
  requireRange("RELAY_REAPER_INTERVAL_SECONDS", cfg.iReaperIntervalSeconds, 1, 86400);
  requireRange("RELAY_ORPHAN_GRACE_SECONDS", cfg.iOrphanGraceSeconds, 0, 86400);
  requireRange("RELAY_SHUTDOWN_GRACE_SECONDS", cfg.iShutdownGraceSeconds, 0, 3600);
  requireRange("RELAY_MEMORY_LIMIT_MB", cfg.iMemoryLimitMb, 0, 1024 * 1024);
  requireRange("RELAY_MEMORY_CHECK_INTERVAL_SECONDS", cfg.iMemoryCheckIntervalSeconds, 1,
               3600);
  requireRange("RELAY_MAX_DOWNLOAD_CONNECTIONS", cfg.iMaxDownloadConnections, 1, 64);
  requireRange("RELAY_MAX_UPLOAD_CONNECTIONS", cfg.iMaxUploadConnections, 1, 64);

  if (cfg.iMaxItemBytes < 1) {
    throw std::runtime_error("RELAY_MAX_ITEM_BYTES must be >= 1 (got " +
                             std::to_string(cfg.iMaxItemBytes) + ")");
  }

  // RELAY_SESSION_IDLE_TIMEOUT_SECONDS >= RELAY_ACQUIRE_TIMEOUT_SECONDS
  if (cfg.iSessionIdleTimeoutSeconds < cfg.iAcquireTimeoutSeconds) {
    throw std::runtime_error(
        "RELAY_SESSION_IDLE_TIMEOUT_SECONDS (" + std::to_string(cfg.iSessionIdleTimeoutSeconds) +
        ") must be >= RELAY_ACQUIRE_TIMEOUT_SECONDS (" +
        std::to_string(cfg.iAcquireTimeoutSeconds) + ")");
  }

  return cfg;
}

}  // namespace relay::common
