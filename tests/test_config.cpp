#include <gtest/gtest.h>
#include "fixtures/archive_builder.hpp"
#include "ugate/core/config.hpp"

#include <algorithm>
#include <cstdlib>

using namespace ugate;
using namespace ugate::fixtures;

namespace {

// Sets an environment variable for one test and unsets it afterwards.
struct ScopedEnv {
  ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
  ~ScopedEnv() { ::unsetenv(name_); }
  const char* name_;
};

bool mentions(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

} // namespace

TEST(ConfigTest, DefaultsAreValid) {
  AppConfig cfg;
  EXPECT_TRUE(validateConfig(cfg).empty());
  EXPECT_EQ(cfg.logging.level, LogLevel::Info);
  EXPECT_FALSE(cfg.temp.baseDir.has_value());
  EXPECT_EQ(cfg.temp.directoryPrefix, "ugate_");
}

TEST(ConfigTest, LoadsYaml) {
  ScratchDir dir;
  writeBytes(dir / "ugate.yaml",
             "security:\n"
             "  zip_bomb:\n"
             "    max_compression_ratio: 50.5\n"
             "  size:\n"
             "    max_uncompressed_file_bytes: 1048576\n"
             "  recursion:\n"
             "    max_files_per_archive: 500\n"
             "    max_nested_depth: 1\n"
             "    scan_nested: true\n"
             "  fs_safety:\n"
             "    allow_absolute_paths: true\n"
             "  allowed_extensions: [\".zip\", \".gz\"]\n"
             "limits:\n"
             "  max_memory_mb: 256\n"
             "  max_concurrent_uploads: 4\n"
             "temp:\n"
             "  base_dir: /var/tmp/uploads\n"
             "  directory_prefix: conv_\n"
             "  max_file_age_hours: 6\n"
             "  cleanup_on_exit: false\n"
             "logging:\n"
             "  level: debug\n");

  AppConfig cfg;
  std::string err;
  ASSERT_TRUE(loadConfigYaml((dir / "ugate.yaml").string(), cfg, err)) << err;
  EXPECT_DOUBLE_EQ(cfg.security.maxCompressionRatio, 50.5);
  EXPECT_EQ(cfg.security.maxUncompressedFileSize, 1048576u);
  EXPECT_EQ(cfg.security.maxTotalUncompressedSize, 10ull << 30);
  EXPECT_EQ(cfg.security.maxFilesPerArchive, 500u);
  EXPECT_EQ(cfg.security.maxNestedArchiveDepth, 1u);
  EXPECT_TRUE(cfg.security.scanNestedArchives);
  EXPECT_TRUE(cfg.security.allowAbsolutePaths);
  EXPECT_EQ(cfg.security.allowedExtensions, (std::vector<std::string>{".zip", ".gz"}));
  EXPECT_EQ(cfg.security.suspiciousPatterns.size(), 7u);
  EXPECT_EQ(cfg.limits.maxMemoryMb, 256u);
  EXPECT_EQ(cfg.limits.maxConcurrentUploads, 4u);
  EXPECT_EQ(cfg.limits.maxConcurrentExtractions, 5u);
  ASSERT_TRUE(cfg.temp.baseDir.has_value());
  EXPECT_EQ(cfg.temp.baseDir->string(), "/var/tmp/uploads");
  EXPECT_EQ(cfg.temp.directoryPrefix, "conv_");
  EXPECT_EQ(cfg.temp.maxFileAgeHours, 6u);
  EXPECT_FALSE(cfg.temp.cleanupOnExit);
  EXPECT_TRUE(cfg.temp.trackFiles);
  EXPECT_EQ(cfg.logging.level, LogLevel::Debug);
  EXPECT_TRUE(validateConfig(cfg).empty());
}

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
  ScratchDir dir;
  writeBytes(dir / "empty.yaml", "# nothing here\n");
  AppConfig cfg;
  std::string err;
  ASSERT_TRUE(loadConfigYaml((dir / "empty.yaml").string(), cfg, err)) << err;
  EXPECT_DOUBLE_EQ(cfg.security.maxCompressionRatio, 100.0);
  EXPECT_EQ(cfg.limits.maxOpenFiles, 100u);
}

TEST(ConfigTest, ReportsBadInput) {
  ScratchDir dir;
  AppConfig cfg;
  std::string err;
  EXPECT_FALSE(loadConfigYaml((dir / "missing.yaml").string(), cfg, err));
  EXPECT_FALSE(err.empty());

  writeBytes(dir / "broken.yaml", "security: [unclosed\n");
  err.clear();
  EXPECT_FALSE(loadConfigYaml((dir / "broken.yaml").string(), cfg, err));
  EXPECT_FALSE(err.empty());

  writeBytes(dir / "list.yaml", "security:\n  allowed_extensions: .zip\n");
  err.clear();
  EXPECT_FALSE(loadConfigYaml((dir / "list.yaml").string(), cfg, err));

  writeBytes(dir / "level.yaml", "logging:\n  level: loud\n");
  err.clear();
  EXPECT_FALSE(loadConfigYaml((dir / "level.yaml").string(), cfg, err));
  EXPECT_EQ(err, "logging.level: unknown level 'loud'");
}

TEST(ConfigTest, EnvironmentOverrides) {
  ScopedEnv tmp("UGATE_TEMP_DIR", "/srv/scratch");
  ScopedEnv lvl("UGATE_LOG_LEVEL", "WARNING");
  ScopedEnv ratio("UGATE_MAX_COMPRESSION_RATIO", "25.5");
  ScopedEnv files("UGATE_MAX_FILES_PER_ARCHIVE", "42");
  ScopedEnv ups("UGATE_MAX_CONCURRENT_UPLOADS", "3");
  ScopedEnv ext("UGATE_MAX_CONCURRENT_EXTRACTIONS", "-1");

  AppConfig cfg;
  applyEnvOverrides(cfg);
  ASSERT_TRUE(cfg.temp.baseDir.has_value());
  EXPECT_EQ(cfg.temp.baseDir->string(), "/srv/scratch");
  EXPECT_EQ(cfg.logging.level, LogLevel::Warn);
  EXPECT_DOUBLE_EQ(cfg.security.maxCompressionRatio, 25.5);
  EXPECT_EQ(cfg.security.maxFilesPerArchive, 42u);
  EXPECT_EQ(cfg.limits.maxConcurrentUploads, 3u);
  EXPECT_EQ(cfg.limits.maxConcurrentExtractions, 5u);   // rejected, default kept
}

TEST(ConfigTest, UnparseableEnvironmentIsSkipped) {
  ScopedEnv ratio("UGATE_MAX_COMPRESSION_RATIO", "high");
  ScopedEnv files("UGATE_MAX_FILES_PER_ARCHIVE", "12abc");
  ScopedEnv lvl("UGATE_LOG_LEVEL", "chatty");
  AppConfig cfg;
  applyEnvOverrides(cfg);
  EXPECT_DOUBLE_EQ(cfg.security.maxCompressionRatio, 100.0);
  EXPECT_EQ(cfg.security.maxFilesPerArchive, 100000u);
  EXPECT_EQ(cfg.logging.level, LogLevel::Info);
}

TEST(ConfigTest, ValidationNamesEveryProblem) {
  AppConfig cfg;
  cfg.security.maxCompressionRatio = 0.0;
  cfg.security.maxFilesPerArchive = 0;
  cfg.security.allowedExtensions = {"zip"};
  cfg.limits.maxConcurrentUploads = 0;
  cfg.temp.directoryPrefix = "a/b";
  cfg.temp.cleanupIntervalMinutes = 0;

  auto errors = validateConfig(cfg);
  EXPECT_EQ(errors.size(), 6u);
  EXPECT_TRUE(mentions(errors, "max_compression_ratio"));
  EXPECT_TRUE(mentions(errors, "max_files_per_archive"));
  EXPECT_TRUE(mentions(errors, "'zip' must start with '.'"));
  EXPECT_TRUE(mentions(errors, "max_concurrent_uploads"));
  EXPECT_TRUE(mentions(errors, "path separator"));
  EXPECT_TRUE(mentions(errors, "cleanup_interval_minutes"));
}

TEST(ConfigTest, ParseLogLevel) {
  LogLevel l = LogLevel::Error;
  EXPECT_TRUE(parseLogLevel("DEBUG", l));
  EXPECT_EQ(l, LogLevel::Debug);
  EXPECT_TRUE(parseLogLevel("warn", l));
  EXPECT_EQ(l, LogLevel::Warn);
  EXPECT_FALSE(parseLogLevel("verbose", l));
  EXPECT_EQ(l, LogLevel::Warn);
}
