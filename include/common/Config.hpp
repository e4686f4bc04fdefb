#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relay::common {

/// Environment variable loader for the relay service.
/// Loads all RELAY_* vars into a typed struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sSessionSecret;  // platform credential (zeroed after handoff to the session factory)

  // ── Staging ───────────────────────────────────────────────────────────
  std::string sStagingDir = "/tmp/media-relay/staging";
  int64_t iMaxItemBytes = 2LL * 1024 * 1024 * 1024;

  // ── Session pool ──────────────────────────────────────────────────────
  int iPoolSize = 3;
  int iSessionIdleTimeoutSeconds = 1800;
  int iAcquireTimeoutSeconds = 60;
  int iAcquireRetries = 2;

  // ── Queue ─────────────────────────────────────────────────────────────
  int iQueueBacklog = 100;
  int iFreeActiveJobs = 1;     // 0 = unlimited
  int iPremiumActiveJobs = 0;  // 0 = unlimited
  int iJobRetentionSeconds = 3600;
  int iShutdownGraceSeconds = 30;

  // ── Reaper ────────────────────────────────────────────────────────────
  int iReaperIntervalSeconds = 300;
  int iOrphanGraceSeconds = 300;

  // ── Memory monitor ────────────────────────────────────────────────────
  int iMemoryLimitMb = 0;  // 0 = monitor disabled
  int iMemoryCheckIntervalSeconds = 15;

  // ── Transfer tuning ───────────────────────────────────────────────────
  bool bConstrainedHost = false;
  int iMaxDownloadConnections = 16;
  int iMaxUploadConnections = 10;

  // ── Loopback platform ─────────────────────────────────────────────────
  std::optional<std::string> oLocalSourceDir;
  std::optional<std::string> oLocalDestDir;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Implements _FILE fallback for RELAY_SESSION_SECRET.
  /// Throws on missing required vars or invalid constraints.
  static Config load();

  /// True when running on a memory-constrained hosting platform
  /// (RENDER, RENDER_EXTERNAL_URL, REPLIT_DEPLOYMENT or REPL_ID set).
  static bool detectConstrainedHost();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);

  /// Read an env var as int64 with a default value.
  static int64_t getEnvInt64(const char* pVarName, int64_t iDefault);
};

}  // namespace relay::common
