#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace relay::core {

/// Parse a JSON job batch into transfer jobs.
///
/// Accepts either {"jobs": [...]} or a bare array. Each job:
///   {"owner": 42, "tier": "premium",
///    "items": [{"ref": "clip.mp4", "kind": "video", "size": 1048576,
///               "destination": "archive"}]}
/// "tier" defaults to free, "kind" to document, "size" to 0 (unknown) and an
/// item's "destination" to the job-level "destination".
/// Throws ValidationError on malformed input.
std::vector<common::TransferJob> parseJobBatch(const std::string& sJson);

}  // namespace relay::core
