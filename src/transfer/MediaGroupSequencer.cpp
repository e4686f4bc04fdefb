#include "transfer/MediaGroupSequencer.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "platform/TransferTuning.hpp"
#include "transfer/StagingArea.hpp"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace relay::transfer {

using common::ItemStatus;

namespace {

/// Byte progress → item progress, throttled to 10% steps per phase.
platform::ProgressFn makeByteReporter(const ItemProgressFn& fnProgress, std::size_t iIndex,
                                      std::size_t iCount, const char* pPhase) {
  if (!fnProgress) return {};
  return [fnProgress, iIndex, iCount, pPhase, iLastStep = -1](int64_t iDone,
                                                              int64_t iTotal) mutable {
    if (iTotal <= 0) return;
    const int iStep = static_cast<int>((iDone * 10) / iTotal);
    if (iStep == iLastStep) return;
    iLastStep = iStep;
    fnProgress(iIndex, iCount,
               "item " + std::to_string(iIndex + 1) + "/" + std::to_string(iCount) + ": " +
                   pPhase + " " + std::to_string(iStep * 10) + "%");
  };
}

}  // namespace

MediaGroupSequencer::MediaGroupSequencer(StagingArea& saArea, SequencerOptions soOptions)
    : _saArea(saArea), _soOptions(soOptions) {}

MediaGroupSequencer::~MediaGroupSequencer() = default;

common::GroupResult MediaGroupSequencer::run(common::TransferJob& tjJob,
                                             platform::IPlatformClient& pcClient,
                                             std::stop_token stToken,
                                             const ItemProgressFn& fnProgress) {
  auto spLog = common::Logger::get();
  common::GroupResult gr;
  const std::size_t iCount = tjJob.vItems.size();

  for (std::size_t i = 0; i < iCount; ++i) {
    auto& miItem = tjJob.vItems[i];

    if (gr.bSessionLost) {
      miItem.status = ItemStatus::Failed;
      miItem.sFailureReason = "session invalidated";
    } else if (stToken.stop_requested()) {
      miItem.status = ItemStatus::Cancelled;
      miItem.sFailureReason = "job cancelled";
    } else if (miItem.kind == common::MediaKind::Unknown) {
      miItem.status = ItemStatus::Unsupported;
      miItem.sFailureReason = "unsupported media type";
    } else if (miItem.iDeclaredBytes > _soOptions.iMaxItemBytes) {
      miItem.status = ItemStatus::TooLarge;
      miItem.sFailureReason = "declared size " + std::to_string(miItem.iDeclaredBytes) +
                              " exceeds limit " + std::to_string(_soOptions.iMaxItemBytes);
    } else {
      if (fnProgress) {
        fnProgress(i, iCount,
                   "item " + std::to_string(i + 1) + "/" + std::to_string(iCount) + " started");
      }
      try {
        transferItem(tjJob.sJobId, miItem, pcClient, [&fnProgress, i, iCount](const char* pPhase) {
          return makeByteReporter(fnProgress, i, iCount, pPhase);
        });
        miItem.status = ItemStatus::Succeeded;
      } catch (const common::SessionInvalidError& ex) {
        miItem.status = ItemStatus::Failed;
        if (stToken.stop_requested()) {
          // Forced abort of a stopping job, not a lost session
          miItem.sFailureReason = "aborted by shutdown";
          spLog->warn("Job {} item {}: transfer aborted: {}", tjJob.sJobId, i + 1, ex.what());
        } else {
          miItem.sFailureReason = ex.what();
          gr.bSessionLost = true;
          spLog->error("Job {} item {}: session lost: {}", tjJob.sJobId, i + 1, ex.what());
        }
      } catch (const common::TooLargeError& ex) {
        miItem.status = ItemStatus::TooLarge;
        miItem.sFailureReason = ex.what();
      } catch (const std::exception& ex) {
        miItem.status = ItemStatus::Failed;
        miItem.sFailureReason = ex.what();
        spLog->warn("Job {} item {} failed: {}", tjJob.sJobId, i + 1, ex.what());
      }
      miItem.sStagingPath.clear();
    }

    switch (miItem.status) {
      case ItemStatus::Succeeded: ++gr.iSucceeded; break;
      case ItemStatus::Failed: ++gr.iFailed; break;
      case ItemStatus::TooLarge:
      case ItemStatus::Unsupported: ++gr.iSkipped; break;
      case ItemStatus::Cancelled: ++gr.iCancelled; break;
      case ItemStatus::Pending: break;
    }
    gr.vItems.push_back(common::ItemOutcome{miItem.sRemoteRef, miItem.status,
                                            miItem.sFailureReason, miItem.sRemoteMessageRef});

    if (fnProgress && miItem.status != ItemStatus::Cancelled) {
      fnProgress(i, iCount,
                 "item " + std::to_string(i + 1) + "/" + std::to_string(iCount) + " " +
                     common::toString(miItem.status));
    }
  }

  spLog->info("Job {} group finished: {}", tjJob.sJobId, gr.summary());
  return gr;
}

void MediaGroupSequencer::transferItem(const std::string& sJobId, common::MediaItem& miItem,
                                       platform::IPlatformClient& pcClient,
                                       const ReporterFactory& fnReporter) {
  StagingFile sfStaging = _saArea.allocate(sJobId, miItem.sRemoteRef);
  const std::string sPath = sfStaging.path().string();
  miItem.sStagingPath = sPath;

  const int64_t iDownloaded = downloadWithFallback(miItem, sPath, pcClient, fnReporter);

  // ── Verify ───────────────────────────────────────────────────────────────
  std::error_code ec;
  const auto iOnDisk = static_cast<int64_t>(fs::file_size(sPath, ec));
  if (ec) {
    throw common::TransferFailedError("staging_missing",
                                      "Downloaded file missing: " + ec.message());
  }
  if (iDownloaded <= 0 || iOnDisk == 0) {
    throw common::TransferFailedError("empty_download", "Download produced no data");
  }
  if (miItem.iDeclaredBytes > 0 && iOnDisk != miItem.iDeclaredBytes) {
    throw common::TransferFailedError(
        "size_mismatch", "Downloaded " + std::to_string(iOnDisk) + " bytes, expected " +
                             std::to_string(miItem.iDeclaredBytes));
  }
  if (iOnDisk > _soOptions.iMaxItemBytes) {
    throw common::TooLargeError("too_large", "Downloaded size " + std::to_string(iOnDisk) +
                                                 " exceeds limit " +
                                                 std::to_string(_soOptions.iMaxItemBytes));
  }

  // ── Upload ───────────────────────────────────────────────────────────────
  const int iUpConnections =
      platform::optimizedConnectionCount(iOnDisk, _soOptions.iMaxUploadConnections);
  std::string sMessageRef =
      pcClient.upload(sPath, miItem.sDestination, iUpConnections, fnReporter("uploading"));
  if (sMessageRef.empty()) {
    throw common::TransferFailedError("upload_failed", "Platform returned no message reference");
  }

  miItem.sRemoteMessageRef = std::move(sMessageRef);
  miItem.iTransferredBytes = iOnDisk;

  if (!sfStaging.remove()) {
    common::Logger::get()->warn("Job {}: staging file {} left for the reaper", sJobId, sPath);
  }
}

int64_t MediaGroupSequencer::downloadWithFallback(common::MediaItem& miItem,
                                                  const std::string& sPath,
                                                  platform::IPlatformClient& pcClient,
                                                  const ReporterFactory& fnReporter) {
  const int iConnections = platform::optimizedConnectionCount(
      miItem.iDeclaredBytes, _soOptions.iMaxDownloadConnections);
  try {
    return pcClient.download(miItem.sRemoteRef, sPath, iConnections, fnReporter("downloading"));
  } catch (const common::TransferFailedError& ex) {
    if (iConnections <= 1) throw;
    common::Logger::get()->warn(
        "Parallel download of {} ({} connections) failed: {}; retrying on one connection",
        miItem.sRemoteRef, iConnections, ex.what());
  }

  std::error_code ec;
  fs::remove(sPath, ec);  // discard the partial file before the retry
  return pcClient.download(miItem.sRemoteRef, sPath, 1, fnReporter("downloading"));
}

}  // namespace relay::transfer
