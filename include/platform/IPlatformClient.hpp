#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace relay::platform {

/// Byte-level progress callback: (bytes done, bytes total; total is 0 when unknown).
using ProgressFn = std::function<void(int64_t, int64_t)>;

/// Pure abstract interface for one authenticated session on the messaging platform.
/// A client is used by one job at a time; abort() may be called from any thread.
///
/// download/upload throw common::TransferFailedError for per-item failures and
/// common::SessionInvalidError when the session itself is unusable.
class IPlatformClient {
 public:
  virtual ~IPlatformClient() = default;

  /// Fetch sRemoteRef into sDestPath using up to iConnections parallel streams.
  /// Returns bytes written.
  virtual int64_t download(const std::string& sRemoteRef, const std::string& sDestPath,
                           int iConnections, const ProgressFn& fnProgress) = 0;

  /// Send sLocalPath to sTarget. Returns the platform's reference to the new message.
  virtual std::string upload(const std::string& sLocalPath, const std::string& sTarget,
                             int iConnections, const ProgressFn& fnProgress) = 0;

  /// Interrupt any in-flight transfer; every later call throws SessionInvalidError.
  virtual void abort() = 0;

  /// End the authenticated session. Idempotent.
  virtual void logout() = 0;
};

/// Establishes authenticated platform sessions for the session pool.
class ISessionFactory {
 public:
  virtual ~ISessionFactory() = default;

  virtual std::unique_ptr<IPlatformClient> connect(const std::string& sSessionId) = 0;
};

}  // namespace relay::platform
