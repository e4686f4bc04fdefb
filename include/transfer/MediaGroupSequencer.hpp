#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>

#include "common/Types.hpp"
#include "platform/IPlatformClient.hpp"

namespace relay::transfer {

class StagingArea;

/// Limits applied per media item.
/// Class abbreviation: so
struct SequencerOptions {
  int64_t iMaxItemBytes = 2LL * 1024 * 1024 * 1024;
  int iMaxDownloadConnections = 16;
  int iMaxUploadConnections = 10;
};

/// Item-level progress: (zero-based item index, item count, message).
using ItemProgressFn = std::function<void(std::size_t, std::size_t, const std::string&)>;

/// Processes a job's media items strictly one at a time:
/// download → verify → upload → delete, so at most one item is staged per job.
/// Per-item failures are recorded and the group continues; a lost session
/// fails the remaining items without attempting them. A session aborted after
/// a stop request is not treated as lost: the remaining items are cancelled.
/// Class abbreviation: mgs
class MediaGroupSequencer {
 public:
  MediaGroupSequencer(StagingArea& saArea, SequencerOptions soOptions);
  ~MediaGroupSequencer();

  /// Run every item of tjJob on pcClient. Item statuses are written back into
  /// tjJob.vItems. Cancellation via stToken is observed between items.
  common::GroupResult run(common::TransferJob& tjJob, platform::IPlatformClient& pcClient,
                          std::stop_token stToken, const ItemProgressFn& fnProgress = {});

  const SequencerOptions& options() const { return _soOptions; }

 private:
  /// Builds a fresh byte-progress reporter for one transfer phase.
  using ReporterFactory = std::function<platform::ProgressFn(const char*)>;

  /// Stage, verify and upload one item. The staging file is gone when this returns
  /// or throws.
  void transferItem(const std::string& sJobId, common::MediaItem& miItem,
                    platform::IPlatformClient& pcClient, const ReporterFactory& fnReporter);

  /// Parallel download, retried once on a single connection after a TransferFailedError.
  int64_t downloadWithFallback(common::MediaItem& miItem, const std::string& sPath,
                               platform::IPlatformClient& pcClient,
                               const ReporterFactory& fnReporter);

  StagingArea& _saArea;
  SequencerOptions _soOptions;
};

}  // namespace relay::transfer
