#include "reaper/ResourceReaper.hpp"

#include "pool/SessionPool.hpp"
#include "transfer/StagingArea.hpp"

#include "../support/FakePlatform.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using relay::pool::SessionPool;
using relay::reaper::ResourceReaper;
using relay::test::FakeSessionFactory;
using relay::test::TempDir;
using relay::transfer::ResourceLedger;
using relay::transfer::StagingArea;

namespace {

fs::path writeFile(const fs::path& path, std::chrono::minutes durAge = 0min) {
  {
    std::ofstream ofs(path);
    ofs << "orphaned bytes";
  }
  if (durAge.count() > 0) {
    fs::last_write_time(path, fs::file_time_type::clock::now() - durAge);
  }
  return path;
}

}  // namespace

class ResourceReaperTest : public ::testing::Test {
 protected:
  ResourceReaperTest() : _sa(_td.path() / "staging", _rl), _sp(_sf, 2, 50ms) {}

  TempDir _td;
  ResourceLedger _rl;
  StagingArea _sa;
  FakeSessionFactory _sf;
  SessionPool _sp;
};

TEST_F(ResourceReaperTest, DeletesOldOrphans) {
  auto pathA = writeFile(_sa.root() / "crashed-job-a.bin", 30min);
  auto pathB = writeFile(_sa.root() / "crashed-job-b.bin", 30min);
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep();
  EXPECT_EQ(srReport.iScanned, 2);
  EXPECT_EQ(srReport.iRemoved, 2);
  EXPECT_EQ(srReport.iFailed, 0);
  EXPECT_FALSE(fs::exists(pathA));
  EXPECT_FALSE(fs::exists(pathB));
}

TEST_F(ResourceReaperTest, KeepsFilesWithinGracePeriod) {
  auto path = writeFile(_sa.root() / "just-written.bin");
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep();
  EXPECT_EQ(srReport.iRemoved, 0);
  EXPECT_TRUE(fs::exists(path));
}

TEST_F(ResourceReaperTest, NeverDeletesLedgerEntries) {
  auto sf = _sa.allocate("live-job", "in-flight.mp4");
  writeFile(sf.path(), 60min);
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep(0s);
  EXPECT_EQ(srReport.iScanned, 1);
  EXPECT_EQ(srReport.iRemoved, 0);
  EXPECT_TRUE(fs::exists(sf.path()));
}

TEST_F(ResourceReaperTest, ZeroGraceRemovesFreshOrphans) {
  auto path = writeFile(_sa.root() / "fresh.bin");
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep(0s);
  EXPECT_EQ(srReport.iRemoved, 1);
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(ResourceReaperTest, RemovesOrphanDirectories) {
  const fs::path pathDir = _sa.root() / "partial-chunks";
  fs::create_directories(pathDir);
  writeFile(pathDir / "chunk-0");
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep(0s);
  EXPECT_EQ(srReport.iRemoved, 1);
  EXPECT_FALSE(fs::exists(pathDir));
}

TEST_F(ResourceReaperTest, MissingStagingDirectoryIsNotAnError) {
  ResourceReaper rr(_td.path() / "does-not-exist", _rl, _sp, 300s);
  auto srReport = rr.sweep();
  EXPECT_EQ(srReport.iScanned, 0);
  EXPECT_EQ(srReport.iRemoved, 0);
  EXPECT_EQ(srReport.iFailed, 0);
}

TEST_F(ResourceReaperTest, EvictsIdleSessions) {
  { auto sg = _sp.acquire(1s); }
  auto sgBusy = _sp.acquire(1s);
  ASSERT_EQ(_sp.idleCount(), 0);

  // One idle session (returned), one in use
  { auto sg = _sp.acquire(1s); }
  std::this_thread::sleep_for(100ms);
  ResourceReaper rr(_sa.root(), _rl, _sp, 300s);

  auto srReport = rr.sweep();
  EXPECT_EQ(srReport.iSessionsEvicted, 1);
  EXPECT_EQ(_sp.inUseCount(), 1);
  EXPECT_EQ(_sp.idleCount(), 0);
}
