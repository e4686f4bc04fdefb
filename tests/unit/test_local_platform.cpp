#include "platform/LocalPlatform.hpp"

#include "common/Errors.hpp"

#include "../support/FakePlatform.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using namespace relay::common;
using relay::platform::LocalPlatformClient;
using relay::platform::LocalSessionFactory;
using relay::test::TempDir;

namespace {

std::string readAll(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

}  // namespace

class LocalPlatformTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fs::create_directories(_td.path() / "src" / "album");
    fs::create_directories(_td.path() / "dst");
    std::ofstream ofs(_td.path() / "src" / "album" / "clip.mp4", std::ios::binary);
    ofs << std::string(1536 * 1024, 'v');  // three copy chunks
  }

  fs::path src() const { return _td.path() / "src"; }
  fs::path dst() const { return _td.path() / "dst"; }
  fs::path scratch() const { return _td.path() / "scratch.bin"; }

  TempDir _td;
};

TEST_F(LocalPlatformTest, DownloadCopiesAndReportsProgress) {
  LocalPlatformClient lpc("s1", src(), dst());
  int iCalls = 0;
  int64_t iLast = 0;
  const auto iBytes = lpc.download("album/clip.mp4", scratch().string(), 4,
                                   [&](int64_t iDone, int64_t iTotal) {
                                     ++iCalls;
                                     iLast = iDone;
                                     EXPECT_EQ(iTotal, 1536 * 1024);
                                   });

  EXPECT_EQ(iBytes, 1536 * 1024);
  EXPECT_EQ(fs::file_size(scratch()), 1536u * 1024u);
  EXPECT_EQ(iCalls, 3);
  EXPECT_EQ(iLast, 1536 * 1024);
}

TEST_F(LocalPlatformTest, UploadPlacesFileUnderTarget) {
  LocalPlatformClient lpc("s1", src(), dst());
  lpc.download("album/clip.mp4", scratch().string(), 1, {});

  const auto sRef = lpc.upload(scratch().string(), "chat-7", 1, {});
  EXPECT_EQ(sRef, "chat-7/scratch.bin");
  EXPECT_EQ(readAll(dst() / "chat-7" / "scratch.bin"), readAll(src() / "album" / "clip.mp4"));
}

TEST_F(LocalPlatformTest, MissingRemoteMediaFails) {
  LocalPlatformClient lpc("s1", src(), dst());
  try {
    lpc.download("album/nope.mp4", scratch().string(), 1, {});
    FAIL() << "expected TransferFailedError";
  } catch (const TransferFailedError& ex) {
    EXPECT_EQ(ex._sErrorCode, "remote_not_found");
  }
}

TEST_F(LocalPlatformTest, ReferencesCannotEscapeRoot) {
  LocalPlatformClient lpc("s1", src(), dst());
  EXPECT_THROW(lpc.download("../dst/x", scratch().string(), 1, {}), TransferFailedError);
  EXPECT_THROW(lpc.download("/etc/hostname", scratch().string(), 1, {}), TransferFailedError);
  EXPECT_THROW(lpc.download("", scratch().string(), 1, {}), TransferFailedError);
  EXPECT_THROW(lpc.upload(scratch().string(), "../../elsewhere", 1, {}), TransferFailedError);
}

TEST_F(LocalPlatformTest, AbortInterruptsTransfer) {
  LocalPlatformClient lpc("s1", src(), dst());
  try {
    lpc.download("album/clip.mp4", scratch().string(), 1,
                 [&lpc](int64_t, int64_t) { lpc.abort(); });
    FAIL() << "expected SessionInvalidError";
  } catch (const SessionInvalidError& ex) {
    EXPECT_EQ(ex._sErrorCode, "session_aborted");
  }
  EXPECT_THROW(lpc.download("album/clip.mp4", scratch().string(), 1, {}), SessionInvalidError);
}

TEST_F(LocalPlatformTest, LoggedOutSessionIsUnusable) {
  LocalPlatformClient lpc("s1", src(), dst());
  lpc.logout();
  lpc.logout();
  EXPECT_THROW(lpc.download("album/clip.mp4", scratch().string(), 1, {}), SessionInvalidError);
}

TEST_F(LocalPlatformTest, FactoryRequiresCredential) {
  LocalSessionFactory lsfEmpty(src(), dst(), "");
  EXPECT_THROW(lsfEmpty.connect("session-1"), SessionInvalidError);

  LocalSessionFactory lsfMissing(_td.path() / "nowhere", dst(), "secret");
  EXPECT_THROW(lsfMissing.connect("session-1"), SessionInvalidError);

  LocalSessionFactory lsf(src(), dst(), "secret");
  auto upClient = lsf.connect("session-1");
  ASSERT_NE(upClient, nullptr);
  EXPECT_GT(upClient->download("album/clip.mp4", scratch().string(), 1, {}), 0);
}
