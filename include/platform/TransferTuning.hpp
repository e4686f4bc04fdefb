#pragma once

#include <cstdint>

namespace relay::platform {

inline constexpr int64_t kFullSpeedBytes = 100LL * 1024 * 1024;

/// Number of parallel connections to use for a transfer of iBytes.
/// Files of at least iFullSize bytes get iMaxCount; smaller files scale linearly
/// but never drop below min(6, iMaxCount / 2). Always returns >= 1.
int optimizedConnectionCount(int64_t iBytes, int iMaxCount,
                             int64_t iFullSize = kFullSpeedBytes);

}  // namespace relay::platform
