#include "transfer/StagingArea.hpp"

#include "../support/FakePlatform.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;
using relay::test::TempDir;
using relay::transfer::ResourceLedger;
using relay::transfer::StagingArea;
using relay::transfer::StagingFile;

namespace {

void touch(const fs::path& path) {
  std::ofstream ofs(path);
  ofs << "payload";
}

}  // namespace

class StagingAreaTest : public ::testing::Test {
 protected:
  TempDir _td;
  ResourceLedger _rl;
};

TEST_F(StagingAreaTest, CreatesMissingRoot) {
  StagingArea sa(_td.path() / "nested" / "staging", _rl);
  EXPECT_TRUE(fs::is_directory(sa.root()));
}

TEST_F(StagingAreaTest, AllocateRegistersPathBeforeFileExists) {
  StagingArea sa(_td.path(), _rl);
  auto sf = sa.allocate("job1", "videos/holiday.mp4");

  EXPECT_FALSE(fs::exists(sf.path()));
  EXPECT_TRUE(_rl.contains(sf.path()));
  EXPECT_EQ(sf.path().parent_path(), sa.root());

  const std::string sName = sf.path().filename().string();
  EXPECT_EQ(sName.rfind("job1-", 0), 0u);
  EXPECT_NE(sName.find("holiday.mp4"), std::string::npos);
}

TEST_F(StagingAreaTest, HintIsSanitized) {
  StagingArea sa(_td.path(), _rl);
  auto sfOdd = sa.allocate("job", "../../etc/pass wd");
  EXPECT_EQ(sfOdd.path().parent_path(), sa.root());
  EXPECT_EQ(sfOdd.path().filename().string().find(' '), std::string::npos);

  auto sfEmpty = sa.allocate("job", "");
  EXPECT_NE(sfEmpty.path().filename().string().find("media"), std::string::npos);
}

TEST_F(StagingAreaTest, PathsAreUnique) {
  StagingArea sa(_td.path(), _rl);
  std::set<fs::path> stPaths;
  std::vector<StagingFile> vFiles;
  for (int i = 0; i < 20; ++i) {
    vFiles.push_back(sa.allocate("job", "same.jpg"));
    stPaths.insert(vFiles.back().path());
  }
  EXPECT_EQ(stPaths.size(), 20u);
  EXPECT_EQ(_rl.size(), 20u);
}

TEST_F(StagingAreaTest, DestructorDeletesFileAndLedgerEntry) {
  StagingArea sa(_td.path(), _rl);
  fs::path path;
  {
    auto sf = sa.allocate("job", "a.bin");
    path = sf.path();
    touch(path);
    ASSERT_TRUE(fs::exists(path));
  }
  EXPECT_FALSE(fs::exists(path));
  EXPECT_FALSE(_rl.contains(path));
  EXPECT_EQ(_rl.size(), 0u);
}

TEST_F(StagingAreaTest, DeletesOnExceptionUnwind) {
  StagingArea sa(_td.path(), _rl);
  fs::path path;
  EXPECT_THROW(
      {
        auto sf = sa.allocate("job", "a.bin");
        path = sf.path();
        touch(path);
        throw std::runtime_error("transfer failed");
      },
      std::runtime_error);
  EXPECT_FALSE(fs::exists(path));
  EXPECT_EQ(_rl.size(), 0u);
}

TEST_F(StagingAreaTest, RemoveIsIdempotentAndToleratesMissingFile) {
  StagingArea sa(_td.path(), _rl);
  auto sf = sa.allocate("job", "never-written.bin");

  EXPECT_TRUE(sf.remove());  // nothing on disk yet
  EXPECT_TRUE(sf.remove());
  EXPECT_EQ(_rl.size(), 0u);
}

TEST_F(StagingAreaTest, MovedFromHandleDoesNotDelete) {
  StagingArea sa(_td.path(), _rl);
  auto sfA = sa.allocate("job", "a.bin");
  touch(sfA.path());
  const fs::path path = sfA.path();

  StagingFile sfB(std::move(sfA));
  EXPECT_TRUE(fs::exists(path));
  EXPECT_TRUE(_rl.contains(path));

  sfB.remove();
  EXPECT_FALSE(fs::exists(path));
}

TEST(ResourceLedgerTest, NormalizesPaths) {
  ResourceLedger rl;
  rl.add("/tmp/staging/./a.bin");
  EXPECT_TRUE(rl.contains("/tmp/staging/a.bin"));
  rl.remove("/tmp/staging/sub/../a.bin");
  EXPECT_FALSE(rl.contains("/tmp/staging/a.bin"));
  EXPECT_TRUE(rl.snapshot().empty());
}
