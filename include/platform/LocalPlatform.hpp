#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "platform/IPlatformClient.hpp"

namespace relay::platform {

/// Loopback platform client backed by two local directories.
/// Remote refs are file names relative to the source directory; uploads are
/// copied into <dest>/<target>/. Used by the CLI and integration tests.
/// Class abbreviation: lpc
class LocalPlatformClient : public IPlatformClient {
 public:
  LocalPlatformClient(std::string sSessionId, std::filesystem::path pathSource,
                      std::filesystem::path pathDest);
  ~LocalPlatformClient() override;

  int64_t download(const std::string& sRemoteRef, const std::string& sDestPath,
                   int iConnections, const ProgressFn& fnProgress) override;
  std::string upload(const std::string& sLocalPath, const std::string& sTarget,
                     int iConnections, const ProgressFn& fnProgress) override;
  void abort() override;
  void logout() override;

 private:
  /// Throws SessionInvalidError when aborted or logged out.
  void ensureUsable() const;

  /// Stream sFrom into sTo in fixed-size chunks, checking for abort between chunks.
  int64_t copyChunked(const std::filesystem::path& pathFrom,
                      const std::filesystem::path& pathTo, const ProgressFn& fnProgress);

  std::string _sSessionId;
  std::filesystem::path _pathSource;
  std::filesystem::path _pathDest;
  std::atomic<bool> _bAborted{false};
  std::atomic<bool> _bLoggedOut{false};
};

/// Creates LocalPlatformClient sessions. The credential must be non-empty.
/// Class abbreviation: lsf
class LocalSessionFactory : public ISessionFactory {
 public:
  LocalSessionFactory(std::filesystem::path pathSource, std::filesystem::path pathDest,
                      std::string sCredential);
  ~LocalSessionFactory() override;

  std::unique_ptr<IPlatformClient> connect(const std::string& sSessionId) override;

 private:
  std::filesystem::path _pathSource;
  std::filesystem::path _pathDest;
  std::string _sCredential;
};

}  // namespace relay::platform
