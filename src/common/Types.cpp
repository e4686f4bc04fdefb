#include "common/Types.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

namespace relay::common {

bool isTerminal(JobState state) {
  return state == JobState::Completed || state == JobState::Failed ||
         state == JobState::Cancelled;
}

std::string toString(Tier tier) {
  return tier == Tier::Premium ? "premium" : "free";
}

std::string toString(JobState state) {
  switch (state) {
    case JobState::Queued: return "queued";
    case JobState::Running: return "running";
    case JobState::Completed: return "completed";
    case JobState::Failed: return "failed";
    case JobState::Cancelled: return "cancelled";
  }
  return "unknown";
}

std::string toString(ItemStatus status) {
  switch (status) {
    case ItemStatus::Pending: return "pending";
    case ItemStatus::Succeeded: return "succeeded";
    case ItemStatus::Failed: return "failed";
    case ItemStatus::TooLarge: return "too_large";
    case ItemStatus::Unsupported: return "unsupported";
    case ItemStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

std::string toString(MediaKind kind) {
  switch (kind) {
    case MediaKind::Document: return "document";
    case MediaKind::Video: return "video";
    case MediaKind::Audio: return "audio";
    case MediaKind::Photo: return "photo";
    case MediaKind::Unknown: return "unknown";
  }
  return "unknown";
}

std::string toString(EventType type) {
  switch (type) {
    case EventType::Queued: return "queued";
    case EventType::Running: return "running";
    case EventType::Progress: return "progress";
    case EventType::Completed: return "completed";
    case EventType::Failed: return "failed";
    case EventType::Cancelled: return "cancelled";
  }
  return "unknown";
}

MediaKind parseMediaKind(const std::string& sKind) {
  if (sKind == "document") return MediaKind::Document;
  if (sKind == "video") return MediaKind::Video;
  if (sKind == "audio") return MediaKind::Audio;
  if (sKind == "photo") return MediaKind::Photo;
  return MediaKind::Unknown;
}

Tier parseTier(const std::string& sTier) {
  return sTier == "premium" ? Tier::Premium : Tier::Free;
}

std::string GroupResult::summary() const {
  std::ostringstream oss;
  oss << iSucceeded << " succeeded, " << iFailed << " failed, " << iSkipped << " skipped";
  if (iCancelled > 0) {
    oss << ", " << iCancelled << " cancelled";
  }

  bool bFirst = true;
  for (size_t i = 0; i < vItems.size(); ++i) {
    const auto& io = vItems[i];
    if (io.status == ItemStatus::Succeeded || io.status == ItemStatus::Pending) continue;
    oss << (bFirst ? " (" : "; ") << "item " << (i + 1) << " " << toString(io.status);
    if (!io.sReason.empty()) {
      oss << ": " << io.sReason;
    }
    bFirst = false;
  }
  if (!bFirst) oss << ")";
  return oss.str();
}

void to_json(nlohmann::json& j, const ItemOutcome& io) {
  j = nlohmann::json{{"remote_ref", io.sRemoteRef},
                     {"status", toString(io.status)},
                     {"reason", io.sReason},
                     {"remote_message_ref", io.sRemoteMessageRef}};
}

void to_json(nlohmann::json& j, const GroupResult& gr) {
  j = nlohmann::json{{"succeeded", gr.iSucceeded},
                     {"failed", gr.iFailed},
                     {"skipped", gr.iSkipped},
                     {"cancelled", gr.iCancelled},
                     {"session_lost", gr.bSessionLost},
                     {"items", gr.vItems},
                     {"summary", gr.summary()}};
}

void to_json(nlohmann::json& j, const StatusEvent& se) {
  const auto iEpochMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                            se.tpEmitted.time_since_epoch())
                            .count();
  j = nlohmann::json{{"seq", se.iSequence},
                     {"job_id", se.sJobId},
                     {"event", toString(se.type)},
                     {"detail", se.sDetail},
                     {"emitted_at_ms", iEpochMs}};
}

}  // namespace relay::common
