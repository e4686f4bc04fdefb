#include "core/JobLoader.hpp"

#include "common/Errors.hpp"

#include <nlohmann/json.hpp>

namespace relay::core {

namespace {

common::MediaItem parseItem(const nlohmann::json& jItem, const std::string& sJobDestination,
                            size_t iJob, size_t iItem) {
  const std::string sWhere =
      "job " + std::to_string(iJob + 1) + " item " + std::to_string(iItem + 1);
  if (!jItem.is_object()) {
    throw common::ValidationError("invalid_item", sWhere + " is not an object");
  }

  common::MediaItem miItem;
  miItem.sRemoteRef = jItem.value("ref", "");
  if (miItem.sRemoteRef.empty()) {
    throw common::ValidationError("invalid_item", sWhere + " has no ref");
  }
  miItem.kind = common::parseMediaKind(jItem.value("kind", "document"));
  miItem.iDeclaredBytes = jItem.value("size", static_cast<int64_t>(0));
  if (miItem.iDeclaredBytes < 0) {
    throw common::ValidationError("invalid_item", sWhere + " has a negative size");
  }
  miItem.sDestination = jItem.value("destination", sJobDestination);
  if (miItem.sDestination.empty()) {
    throw common::ValidationError("invalid_item", sWhere + " has no destination");
  }
  return miItem;
}

}  // namespace

std::vector<common::TransferJob> parseJobBatch(const std::string& sJson) {
  nlohmann::json jRoot;
  try {
    jRoot = nlohmann::json::parse(sJson);
  } catch (const nlohmann::json::exception& ex) {
    throw common::ValidationError("invalid_json", std::string("Invalid job batch: ") + ex.what());
  }

  const nlohmann::json& jJobs = jRoot.is_object() && jRoot.contains("jobs") ? jRoot["jobs"] : jRoot;
  if (!jJobs.is_array()) {
    throw common::ValidationError("invalid_batch", "Job batch must be an array of jobs");
  }

  std::vector<common::TransferJob> vJobs;
  vJobs.reserve(jJobs.size());
  try {
    for (size_t i = 0; i < jJobs.size(); ++i) {
      const auto& jJob = jJobs[i];
      if (!jJob.is_object()) {
        throw common::ValidationError("invalid_job",
                                      "job " + std::to_string(i + 1) + " is not an object");
      }

      common::TransferJob tj;
      tj.iOwnerId = jJob.value("owner", static_cast<int64_t>(0));
      tj.tier = common::parseTier(jJob.value("tier", "free"));
      const std::string sDestination = jJob.value("destination", "");

      const auto itItems = jJob.find("items");
      if (itItems == jJob.end() || !itItems->is_array() || itItems->empty()) {
        throw common::ValidationError("invalid_job",
                                      "job " + std::to_string(i + 1) + " has no items");
      }
      for (size_t j = 0; j < itItems->size(); ++j) {
        tj.vItems.push_back(parseItem((*itItems)[j], sDestination, i, j));
      }
      vJobs.push_back(std::move(tj));
    }
  } catch (const nlohmann::json::type_error& ex) {
    throw common::ValidationError("invalid_field", std::string("Wrong field type: ") + ex.what());
  }
  return vJobs;
}

}  // namespace relay::core
