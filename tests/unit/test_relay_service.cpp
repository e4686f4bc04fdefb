#include "core/RelayService.hpp"

#include "common/Errors.hpp"
#include "platform/LocalPlatform.hpp"
#include "pool/SessionPool.hpp"

#include "../support/FakePlatform.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using namespace relay::common;
using relay::core::RelayService;
using relay::platform::LocalSessionFactory;
using relay::test::FakeSessionFactory;
using relay::test::Gate;
using relay::test::TempDir;
using relay::test::waitFor;

namespace {

void writeFile(const fs::path& path, std::size_t iBytes) {
  fs::create_directories(path.parent_path());
  std::ofstream ofs(path, std::ios::binary);
  ofs << std::string(iBytes, 'm');
}

}  // namespace

class RelayServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _cfg.sSessionSecret = "loopback-secret";
    _cfg.sStagingDir = (_td.path() / "staging").string();
    _cfg.iPoolSize = 2;
    _cfg.iSessionIdleTimeoutSeconds = 60;
    _cfg.iAcquireTimeoutSeconds = 5;
    _cfg.iShutdownGraceSeconds = 5;
    _cfg.iReaperIntervalSeconds = 3600;
    _cfg.iOrphanGraceSeconds = 0;

    writeFile(src() / "holiday" / "beach.jpg", 4096);
    writeFile(src() / "holiday" / "sunset.mp4", 700 * 1024);
    fs::create_directories(dst());
  }

  fs::path src() const { return _td.path() / "source"; }
  fs::path dst() const { return _td.path() / "dest"; }
  fs::path staging() const { return _td.path() / "staging"; }

  TransferJob holidayJob() const {
    TransferJob tj;
    tj.iOwnerId = 99;
    MediaItem miPhoto;
    miPhoto.sRemoteRef = "holiday/beach.jpg";
    miPhoto.kind = MediaKind::Photo;
    miPhoto.iDeclaredBytes = 4096;
    miPhoto.sDestination = "album";
    MediaItem miVideo;
    miVideo.sRemoteRef = "holiday/sunset.mp4";
    miVideo.kind = MediaKind::Video;
    miVideo.sDestination = "album";
    tj.vItems = {miPhoto, miVideo};
    return tj;
  }

  TempDir _td;
  Config _cfg;
};

TEST_F(RelayServiceTest, RelaysJobEndToEnd) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  rs.start();

  const auto sJobId = rs.submit(holidayJob());
  ASSERT_TRUE(rs.waitIdle(10s));

  auto oSnap = rs.status(sJobId);
  ASSERT_TRUE(oSnap.has_value());
  EXPECT_EQ(oSnap->tjJob.state, JobState::Completed);
  EXPECT_EQ(oSnap->oResult->iSucceeded, 2);
  EXPECT_EQ(fs::file_size(dst() / "album" / fs::path(oSnap->tjJob.vItems[1].sRemoteMessageRef)
                                                 .filename()),
            700u * 1024u);
  EXPECT_TRUE(fs::is_empty(staging()));
  EXPECT_EQ(rs.ledger().size(), 0u);
}

TEST_F(RelayServiceTest, ShutdownClosesSessionsAndSweepsOrphans) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  rs.start();
  rs.submit(holidayJob());
  ASSERT_TRUE(rs.waitIdle(10s));
  ASSERT_EQ(rs.sessionPool().size(), 1);

  // Left behind by a previous crash
  writeFile(staging() / "deadbeef-0000-leftover.bin", 128);

  auto srFinal = rs.shutdown();
  EXPECT_EQ(srFinal.iRemoved, 1);
  EXPECT_EQ(rs.sessionPool().size(), 0);
  EXPECT_TRUE(rs.sessionPool().isClosed());
  EXPECT_TRUE(fs::is_empty(staging()));

  // Idempotent
  auto srAgain = rs.shutdown();
  EXPECT_EQ(srAgain.iRemoved, 0);
}

TEST_F(RelayServiceTest, SubmitAfterShutdownIsRejected) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  rs.start();
  rs.shutdown();
  EXPECT_THROW(rs.submit(holidayJob()), PoolClosedError);
}

TEST_F(RelayServiceTest, ShutdownAbortsTransfersThatOutliveGrace) {
  _cfg.iShutdownGraceSeconds = 0;
  FakeSessionFactory fsf;
  fsf.state().addMedia("holiday/beach.jpg", 4096);
  fsf.state().addMedia("holiday/sunset.mp4", 1024);
  Gate gate;
  fsf.state().fnOnDownload = [&gate](const std::string&, const std::string&) { gate.wait(); };

  RelayService rs(_cfg, fsf);
  rs.start();
  const auto sJobId = rs.submit(holidayJob());
  ASSERT_TRUE(waitFor([&fsf]() { return fsf.state().downloads().size() == 1; }));

  std::thread thOpen([&gate]() {
    std::this_thread::sleep_for(200ms);
    gate.open();
  });
  rs.shutdown();
  thOpen.join();

  auto oSnap = rs.status(sJobId);
  ASSERT_TRUE(oSnap.has_value());
  EXPECT_EQ(oSnap->tjJob.state, JobState::Cancelled);
  ASSERT_TRUE(oSnap->oResult.has_value());
  EXPECT_FALSE(oSnap->oResult->bSessionLost);
  EXPECT_EQ(oSnap->tjJob.vItems[0].sFailureReason, "aborted by shutdown");
  EXPECT_EQ(oSnap->tjJob.vItems[1].status, ItemStatus::Cancelled);
  EXPECT_EQ(rs.sessionPool().size(), 0);
  EXPECT_EQ(fsf.state().iLogouts.load(), 1);
  EXPECT_TRUE(fs::is_empty(staging()));
  EXPECT_EQ(rs.ledger().size(), 0u);
}

TEST_F(RelayServiceTest, MemoryPressureSweepsImmediatelyWhenIdle) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  writeFile(staging() / "orphan.bin", 64);

  rs.onMemoryPressure();
  EXPECT_FALSE(fs::exists(staging() / "orphan.bin"));
}

TEST_F(RelayServiceTest, MemoryPressureTriggersScheduledSweep) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  rs.start();
  std::this_thread::sleep_for(100ms);  // first scheduled pass has run
  writeFile(staging() / "orphan.bin", 64);

  rs.onMemoryPressure();
  EXPECT_TRUE(waitFor([this]() { return !fs::exists(staging() / "orphan.bin"); }));
}

TEST_F(RelayServiceTest, MemoryPressureDuringShutdownIsSafe) {
  LocalSessionFactory lsf(src(), dst(), _cfg.sSessionSecret);
  RelayService rs(_cfg, lsf);
  rs.start();
  writeFile(staging() / "orphan.bin", 64);

  std::atomic<bool> bDone{false};
  std::thread thPressure([&rs, &bDone]() {
    while (!bDone.load()) {
      rs.onMemoryPressure();
      std::this_thread::sleep_for(1ms);
    }
  });
  std::this_thread::sleep_for(20ms);
  rs.shutdown();
  bDone.store(true);
  thPressure.join();

  EXPECT_FALSE(fs::exists(staging() / "orphan.bin"));
  EXPECT_EQ(rs.sessionPool().size(), 0);
}
