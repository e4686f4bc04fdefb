#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace relay::common {

/// Access tier of the requesting user.
enum class Tier { Free, Premium };

/// Transfer job lifecycle. Completed, Failed and Cancelled are terminal.
enum class JobState { Queued, Running, Completed, Failed, Cancelled };

/// Outcome of a single media item.
enum class ItemStatus { Pending, Succeeded, Failed, TooLarge, Unsupported, Cancelled };

/// Media kinds the platform can relay. Unknown items are skipped as unsupported.
enum class MediaKind { Document, Video, Audio, Photo, Unknown };

/// Kind of a status event. Progress carries item-level updates for a Running job.
enum class EventType { Queued, Running, Progress, Completed, Failed, Cancelled };

/// One file within a transfer job.
/// Class abbreviation: mi
struct MediaItem {
  std::string sRemoteRef;
  MediaKind kind = MediaKind::Document;
  int64_t iDeclaredBytes = 0;  // 0 = unknown
  std::string sDestination;

  std::string sStagingPath;  // set while downloaded, cleared once deleted
  ItemStatus status = ItemStatus::Pending;
  std::string sFailureReason;
  std::string sRemoteMessageRef;
  int64_t iTransferredBytes = 0;
};

/// A requested relay of one or more media items.
/// Class abbreviation: tj
struct TransferJob {
  std::string sJobId;  // assigned on submit
  int64_t iOwnerId = 0;
  Tier tier = Tier::Free;
  std::vector<MediaItem> vItems;

  JobState state = JobState::Queued;
  uint64_t iArrivalSeq = 0;
  std::string sDetail;
  std::chrono::system_clock::time_point tpSubmitted;
  std::chrono::system_clock::time_point tpStarted;
  std::chrono::system_clock::time_point tpFinished;
};

/// Per-item line of a group result.
/// Class abbreviation: io
struct ItemOutcome {
  std::string sRemoteRef;
  ItemStatus status = ItemStatus::Pending;
  std::string sReason;
  std::string sRemoteMessageRef;
};

/// Aggregate result of a media group run.
/// Class abbreviation: gr
struct GroupResult {
  int iSucceeded = 0;
  int iFailed = 0;
  int iSkipped = 0;    // TooLarge + Unsupported
  int iCancelled = 0;
  bool bSessionLost = false;
  std::vector<ItemOutcome> vItems;

  /// Human-readable breakdown, e.g. "4 succeeded, 1 failed (item 3: timeout)".
  std::string summary() const;
};

/// Ordered status notification for the notification layer.
/// Consumers de-duplicate by (sJobId, type).
/// Class abbreviation: se
struct StatusEvent {
  uint64_t iSequence = 0;
  std::string sJobId;
  EventType type = EventType::Queued;
  std::string sDetail;
  std::chrono::system_clock::time_point tpEmitted;
};

bool isTerminal(JobState state);

std::string toString(Tier tier);
std::string toString(JobState state);
std::string toString(ItemStatus status);
std::string toString(MediaKind kind);
std::string toString(EventType type);

/// Parse a media kind name ("document", "video", "audio", "photo").
/// Unrecognized names map to MediaKind::Unknown.
MediaKind parseMediaKind(const std::string& sKind);

/// Parse "premium" or "free" (case-sensitive). Anything else is Free.
Tier parseTier(const std::string& sTier);

void to_json(nlohmann::json& j, const ItemOutcome& io);
void to_json(nlohmann::json& j, const GroupResult& gr);
void to_json(nlohmann::json& j, const StatusEvent& se);

}  // namespace relay::common
