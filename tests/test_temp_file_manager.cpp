#include <gtest/gtest.h>
#include "fixtures/archive_builder.hpp"
#include "ugate/core/errors.hpp"
#include "ugate/tempfs/temp_file_manager.hpp"

#include <limits>
#include <thread>
#include <vector>

using namespace ugate;
using namespace ugate::fixtures;
namespace fs = std::filesystem;

namespace {

TempFileConfig under(const ScratchDir& dir) {
  TempFileConfig cfg;
  cfg.baseDir = dir / "base";
  return cfg;
}

bool isUnder(const fs::path& p, const fs::path& base) {
  fs::path rel = p.lexically_relative(base);
  return !rel.empty() && *rel.begin() != "..";
}

} // namespace

TEST(TempFileManagerTest, CreatesBaseDirectory) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  EXPECT_TRUE(fs::is_directory(dir / "base"));
  EXPECT_EQ(mgr.baseDirectory(), dir / "base");
}

TEST(TempFileManagerTest, DirectoryIsPrivateAndNamedForJob) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path d = mgr.createTempDirectory(std::string("J1"));
  EXPECT_TRUE(fs::is_directory(d));
  EXPECT_TRUE(isUnder(d, mgr.baseDirectory()));
  EXPECT_EQ(fs::status(d).permissions() & fs::perms::all, fs::perms::owner_all);
  const std::string name = d.filename().string();
  EXPECT_EQ(name.rfind("ugate_J1_", 0), 0u);
  EXPECT_EQ(name.size(), std::string("ugate_J1_").size() + 8);

  fs::path custom = mgr.createTempDirectory(std::nullopt, std::string("conv_"));
  EXPECT_EQ(custom.filename().string().rfind("conv_", 0), 0u);
  EXPECT_NE(d, custom);
}

TEST(TempFileManagerTest, FileIsPrivateAndEmpty) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path f = mgr.createTempFile(std::string(".zip"), std::nullopt, std::string("J1"));
  EXPECT_TRUE(fs::is_regular_file(f));
  EXPECT_EQ(fs::file_size(f), 0u);
  EXPECT_EQ(fs::status(f).permissions() & fs::perms::all,
            fs::perms::owner_read | fs::perms::owner_write);
  EXPECT_EQ(f.extension(), ".zip");
  EXPECT_EQ(f.filename().string().rfind("temp_", 0), 0u);
  EXPECT_TRUE(isUnder(f, mgr.baseDirectory()));
  // directory created for it plus the file itself
  EXPECT_EQ(mgr.trackedCount("J1"), 2u);
}

TEST(TempFileManagerTest, FileInExistingDirectory) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path d = mgr.createTempDirectory(std::string("J1"));
  fs::path f = mgr.createTempFile(std::nullopt, std::string("part_"), std::string("J1"), d);
  EXPECT_EQ(f.parent_path(), d);
  EXPECT_EQ(mgr.trackedCount(), 2u);
}

TEST(TempFileManagerTest, DirectoryOutsideBaseIsRejected) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  EXPECT_THROW(mgr.createTempFile(std::nullopt, std::nullopt, std::nullopt, dir.path()), SecurityError);
  EXPECT_THROW(mgr.createTempFile(std::nullopt, std::nullopt, std::nullopt,
                                  mgr.baseDirectory() / ".." / "elsewhere"),
               SecurityError);
  EXPECT_EQ(mgr.trackedCount(), 0u);
}

TEST(TempFileManagerTest, RejectsNamesThatAreNotPlain) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  EXPECT_THROW(mgr.createTempDirectory(std::string("../evil")), SecurityError);
  EXPECT_THROW(mgr.createTempDirectory(std::string("")), SecurityError);
  EXPECT_THROW(mgr.createTempDirectory(std::string("..")), SecurityError);
  EXPECT_THROW(mgr.createTempDirectory(std::nullopt, std::string("a/b")), SecurityError);
  EXPECT_THROW(mgr.createTempFile(std::string("/x")), SecurityError);
  EXPECT_EQ(mgr.trackedCount(), 0u);
}

TEST(TempFileManagerTest, JobCleanupRemovesOnlyThatJob) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path d0 = mgr.createTempDirectory(std::string("J0"));
  const size_t before = mgr.trackedCount();
  fs::path d1 = mgr.createTempDirectory(std::string("J1"));
  fs::path f1 = mgr.createTempFile(std::string(".txt"), std::nullopt, std::string("J1"), d1);
  writeBytes(f1, "data");
  fs::path d2 = mgr.createTempDirectory(std::string("J2"));

  EXPECT_EQ(mgr.trackedCount("J1"), 2u);
  EXPECT_EQ(mgr.cleanupJobFiles("J1"), 1u);   // the file goes with its directory
  EXPECT_FALSE(fs::exists(d1));
  EXPECT_TRUE(fs::exists(d2));
  EXPECT_EQ(mgr.trackedCount("J1"), 0u);
  EXPECT_EQ(mgr.trackedCount("J2"), 1u);
  EXPECT_EQ(mgr.trackedCount(), before + 1);   // only J2 was added since
  EXPECT_TRUE(fs::exists(d0));

  EXPECT_EQ(mgr.cleanupJobFiles("J1"), 0u);
  EXPECT_EQ(mgr.cleanupJobFiles("nobody"), 0u);
}

TEST(TempFileManagerTest, CleanupIsIdempotent) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path f = mgr.createTempFile();
  EXPECT_TRUE(mgr.cleanupFile(f));
  EXPECT_FALSE(fs::exists(f));
  EXPECT_TRUE(mgr.cleanupFile(f));

  fs::path d = mgr.createTempDirectory();
  EXPECT_TRUE(mgr.cleanupDirectory(d));
  EXPECT_TRUE(mgr.cleanupDirectory(d));
  EXPECT_FALSE(fs::exists(d));
}

TEST(TempFileManagerTest, CleanupRefusesPathsOutsideBase) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::create_directories(dir / "victim");
  writeBytes(dir / "victim" / "keep.txt", "not a temp file");

  EXPECT_FALSE(mgr.cleanupDirectory(dir / "victim"));
  EXPECT_FALSE(mgr.cleanupFile(dir / "victim" / "keep.txt"));
  EXPECT_FALSE(mgr.cleanupDirectory(mgr.baseDirectory() / ".." / "victim"));
  EXPECT_FALSE(mgr.cleanupDirectory(mgr.baseDirectory()));
  EXPECT_FALSE(mgr.cleanupDirectory(mgr.baseDirectory() / "."));
  EXPECT_TRUE(fs::exists(dir / "victim" / "keep.txt"));
  EXPECT_TRUE(fs::is_directory(mgr.baseDirectory()));
}

TEST(TempFileManagerTest, ExistingBaseIsMadePrivate) {
  ScratchDir dir;
  fs::create_directories(dir / "base");
  fs::permissions(dir / "base", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                fs::perms::others_read | fs::perms::others_exec);
  SecureTempFileManager mgr(under(dir));
  EXPECT_EQ(fs::status(dir / "base").permissions() & fs::perms::all, fs::perms::owner_all);
}

TEST(TempFileManagerTest, SymlinkedBaseIsRejected) {
  ScratchDir dir;
  fs::create_directories(dir / "elsewhere");
  fs::create_directory_symlink(dir / "elsewhere", dir / "base");
  EXPECT_THROW(SecureTempFileManager mgr(under(dir)), SecurityError);
}

TEST(TempFileManagerTest, HugeMaxAgeKeepsEverything) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path kept = mgr.createTempDirectory();
  writeBytes(mgr.baseDirectory() / "stray.bin", "x");

  EXPECT_EQ(mgr.cleanupOldFiles(1e300), 0u);
  EXPECT_EQ(mgr.cleanupOldFiles(std::numeric_limits<double>::infinity()), 0u);
  EXPECT_TRUE(fs::exists(kept));
  EXPECT_TRUE(fs::exists(mgr.baseDirectory() / "stray.bin"));
  EXPECT_EQ(mgr.trackedCount(), 1u);
}

TEST(TempFileManagerTest, ScopedHandlesAreCounted) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  {
    TempDirectory a = mgr.tempDirectory();
    TempFile f = mgr.tempFile();
    EXPECT_EQ(mgr.liveScopedEntries(), 2u);
    TempDirectory b(std::move(a));
    EXPECT_EQ(mgr.liveScopedEntries(), 2u);
  }
  EXPECT_EQ(mgr.liveScopedEntries(), 0u);
}

TEST(TempFileManagerTest, ScopedEntriesAreReclaimed) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path dpath, fpath;
  {
    TempDirectory d = mgr.tempDirectory(std::string("S"));
    dpath = d.path();
    writeBytes(dpath / "inner.txt", "x");
    TempFile f = mgr.tempFile(std::string(".log"));
    fpath = f.path();
    EXPECT_TRUE(fs::exists(dpath));
    EXPECT_TRUE(fs::exists(fpath));
  }
  EXPECT_FALSE(fs::exists(dpath));
  EXPECT_FALSE(fs::exists(fpath));
  EXPECT_EQ(mgr.trackedCount("S"), 0u);
}

TEST(TempFileManagerTest, ScopedDirectoryReclaimedOnException) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path dpath;
  try {
    TempDirectory d = mgr.tempDirectory();
    dpath = d.path();
    throw std::runtime_error("conversion failed");
  } catch (const std::runtime_error&) {
  }
  ASSERT_FALSE(dpath.empty());
  EXPECT_FALSE(fs::exists(dpath));
}

TEST(TempFileManagerTest, ScopedMoveKeepsEntryAlive) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path dpath;
  {
    TempDirectory a = mgr.tempDirectory();
    dpath = a.path();
    TempDirectory b(std::move(a));
    EXPECT_TRUE(fs::exists(dpath));
  }
  EXPECT_FALSE(fs::exists(dpath));
}

TEST(TempFileManagerTest, OrphansAreFoundAndAged) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  fs::path kept = mgr.createTempDirectory();
  writeBytes(mgr.baseDirectory() / "stray.bin", "left by a crash");
  fs::create_directories(mgr.baseDirectory() / "stray_dir" / "deep");

  auto orphans = mgr.findOrphanedFiles();
  EXPECT_EQ(orphans.size(), 2u);

  // nothing is older than a day yet
  EXPECT_EQ(mgr.cleanupOldFiles(), 0u);
  EXPECT_TRUE(fs::exists(mgr.baseDirectory() / "stray.bin"));

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(mgr.cleanupOldFiles(0.0), 3u);
  EXPECT_FALSE(fs::exists(kept));
  EXPECT_FALSE(fs::exists(mgr.baseDirectory() / "stray.bin"));
  EXPECT_FALSE(fs::exists(mgr.baseDirectory() / "stray_dir"));
  EXPECT_TRUE(mgr.findOrphanedFiles().empty());
  EXPECT_EQ(mgr.trackedCount(), 0u);
}

TEST(TempFileManagerTest, StatsAndQuota) {
  ScratchDir dir;
  TempFileConfig cfg = under(dir);
  cfg.maxTotalSizeMb = 1;
  SecureTempFileManager mgr(cfg);

  fs::path d = mgr.createTempDirectory();
  fs::path f = mgr.createTempFile(std::nullopt, std::nullopt, std::nullopt, d);
  writeBytes(f, std::string(1000, 'x'));

  TempFileStats st = mgr.stats();
  EXPECT_EQ(st.baseDirectory, mgr.baseDirectory());
  EXPECT_EQ(st.trackedDirectories, 1u);
  EXPECT_EQ(st.trackedFiles, 1u);
  EXPECT_EQ(st.totalSizeBytes, 1000u);
  EXPECT_EQ(st.orphanedEntries, 0u);
  EXPECT_EQ(st.maxSizeMb, 1u);
  EXPECT_FALSE(st.overQuota);

  writeBytes(d / "big.bin", std::string((1u << 20) + 1, 'y'));
  EXPECT_TRUE(mgr.stats().overQuota);
  EXPECT_EQ(mgr.totalSize(), 1000u + (1u << 20) + 1);

  auto entries = mgr.trackedEntries();
  ASSERT_EQ(entries.size(), 2u);
  for (const auto& e : entries) {
    if (e.isDirectory) EXPECT_EQ(e.sizeBytes, 1000u + (1u << 20) + 1);
    else EXPECT_EQ(e.sizeBytes, 1000u);
  }
}

TEST(TempFileManagerTest, UntrackedModeCreatesButForgets) {
  ScratchDir dir;
  TempFileConfig cfg = under(dir);
  cfg.trackFiles = false;
  fs::path d;
  {
    SecureTempFileManager mgr(cfg);
    d = mgr.createTempDirectory(std::string("J"));
    EXPECT_TRUE(fs::exists(d));
    EXPECT_EQ(mgr.trackedCount(), 0u);
    EXPECT_EQ(mgr.findOrphanedFiles().size(), 1u);
  }
  EXPECT_TRUE(fs::exists(d));
}

TEST(TempFileManagerTest, DestructorHonoursCleanupOnExit) {
  ScratchDir dir;
  fs::path gone, kept;
  {
    SecureTempFileManager mgr(under(dir));
    gone = mgr.createTempDirectory();
  }
  EXPECT_FALSE(fs::exists(gone));

  TempFileConfig cfg = under(dir);
  cfg.cleanupOnExit = false;
  {
    SecureTempFileManager mgr(cfg);
    kept = mgr.createTempDirectory();
  }
  EXPECT_TRUE(fs::exists(kept));
}

TEST(TempFileManagerTest, BackgroundSweepRemovesExpiredEntries) {
  ScratchDir dir;
  TempFileConfig cfg = under(dir);
  cfg.maxFileAgeHours = 0;
  SecureTempFileManager mgr(cfg);
  fs::path d = mgr.createTempDirectory();

  mgr.startBackgroundCleanup(std::chrono::milliseconds(20));
  EXPECT_TRUE(mgr.backgroundCleanupRunning());
  for (int i = 0; i < 100 && fs::exists(d); ++i)
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(fs::exists(d));

  mgr.stopBackgroundCleanup();
  EXPECT_FALSE(mgr.backgroundCleanupRunning());
  mgr.stopBackgroundCleanup();
}

TEST(TempFileManagerTest, ConcurrentCreateAndCleanup) {
  ScratchDir dir;
  SecureTempFileManager mgr(under(dir));
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&mgr, t] {
      const std::string job = "job" + std::to_string(t);
      for (int i = 0; i < 10; ++i) {
        fs::path d = mgr.createTempDirectory(job);
        mgr.createTempFile(std::string(".dat"), std::nullopt, job, d);
      }
      mgr.cleanupJobFiles(job);
    });
  }
  for (auto& th : threads) th.join();
  EXPECT_EQ(mgr.trackedCount(), 0u);
  EXPECT_TRUE(mgr.findOrphanedFiles().empty());
}
