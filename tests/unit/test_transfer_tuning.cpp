#include "platform/TransferTuning.hpp"

#include <gtest/gtest.h>

using relay::platform::kFullSpeedBytes;
using relay::platform::optimizedConnectionCount;

TEST(TransferTuningTest, LargeFilesUseAllConnections) {
  EXPECT_EQ(optimizedConnectionCount(kFullSpeedBytes, 16), 16);
  EXPECT_EQ(optimizedConnectionCount(5 * kFullSpeedBytes, 12), 12);
}

TEST(TransferTuningTest, SmallFilesKeepAFloor) {
  EXPECT_EQ(optimizedConnectionCount(0, 16), 6);
  EXPECT_EQ(optimizedConnectionCount(1024, 16), 6);
  EXPECT_EQ(optimizedConnectionCount(1024, 8), 4);
}

TEST(TransferTuningTest, MidSizedFilesScaleLinearly) {
  EXPECT_EQ(optimizedConnectionCount(kFullSpeedBytes / 2, 16), 8);
  EXPECT_EQ(optimizedConnectionCount(kFullSpeedBytes * 3 / 4, 16), 12);
}

TEST(TransferTuningTest, NeverReturnsLessThanOne) {
  EXPECT_EQ(optimizedConnectionCount(1024, 1), 1);
  EXPECT_EQ(optimizedConnectionCount(1024, 0), 1);
  EXPECT_EQ(optimizedConnectionCount(-5, -3), 1);
}

TEST(TransferTuningTest, CustomFullSizeThreshold) {
  EXPECT_EQ(optimizedConnectionCount(10, 10, 10), 10);
  EXPECT_EQ(optimizedConnectionCount(9, 10, 10), 9);
}
