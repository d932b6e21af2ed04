// src/main.cpp
#include "ugate/core/config.hpp"
#include "ugate/core/extract.hpp"
#include "ugate/core/file_scanner.hpp"
#include "ugate/core/json.hpp"
#include "ugate/limits/resource_limiter.hpp"
#include "ugate/log.h"
#include "ugate/tempfs/temp_file_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ugate;

namespace {

enum ExitCode { kAllSafe = 0, kUnsafe = 1, kUsage = 2, kResourceLimit = 3 };

void usage(std::ostream& os) {
  os << "usage: ugate-scan [--config FILE] [--no-content] [--extract] [--job ID] FILE...\n"
        "  --config FILE   YAML configuration (env UGATE_* overrides it)\n"
        "  --no-content    skip the text content scan\n"
        "  --extract       extract safe archives into job scratch space\n"
        "  --job ID        job id for scratch space (default: random)\n"
        "exit: 0 all safe, 1 unsafe, 2 usage/config/io error, 3 resource limit\n";
}

struct CliArgs {
  std::optional<std::string> configPath;
  bool scanContent = true;
  bool extract = false;
  std::optional<std::string> jobId;
  std::vector<std::string> files;
};

// false = stop with exitCode
bool parseArgs(int argc, char** argv, CliArgs& out, int& exitCode) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto needValue = [&](const char* flag) -> std::optional<std::string> {
      if (i + 1 >= argc) { std::cerr << flag << " needs a value\n"; return std::nullopt; }
      return std::string(argv[++i]);
    };
    if (a == "-h" || a == "--help") { usage(std::cout); exitCode = kAllSafe; return false; }
    if (a == "--no-content") { out.scanContent = false; continue; }
    if (a == "--extract")    { out.extract = true; continue; }
    if (a == "--config" || a == "--job") {
      auto v = needValue(a.c_str());
      if (!v) { usage(std::cerr); exitCode = kUsage; return false; }
      if (a == "--config") out.configPath = *v; else out.jobId = *v;
      continue;
    }
    if (a.rfind("--", 0) == 0) {
      std::cerr << "unknown option " << a << "\n";
      usage(std::cerr);
      exitCode = kUsage;
      return false;
    }
    out.files.push_back(a);
  }
  if (out.files.empty()) { usage(std::cerr); exitCode = kUsage; return false; }
  return true;
}

int worse(int a, int b) {
  // resource limit outranks io error outranks unsafe
  auto rank = [](int c) { return c == kResourceLimit ? 3 : c == kUsage ? 2 : c == kUnsafe ? 1 : 0; };
  return rank(a) >= rank(b) ? a : b;
}

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  int exitCode = kAllSafe;
  if (!parseArgs(argc, argv, args, exitCode)) return exitCode;

  AppConfig cfg;
  if (args.configPath) {
    std::string err;
    if (!loadConfigYaml(*args.configPath, cfg, err)) {
      LOGE("config " + *args.configPath + ": " + err);
      return kUsage;
    }
  }
  applyEnvOverrides(cfg);
  auto problems = validateConfig(cfg);
  if (!problems.empty()) {
    for (const auto& p : problems) LOGE("config: " + p);
    return kUsage;
  }
  setLogLevel(cfg.logging.level);

  const std::string jobId = args.jobId ? *args.jobId : "cli_" + randomSuffix(8);
  FileSecurityScanner scanner(cfg.security);
  ResourceLimiter limiter(cfg.limits);

  try {
    SecureTempFileManager scratch(cfg.temp);
    LOGI("job=" + jobId + " scratch=" + scratch.baseDirectory().string());

    for (const auto& file : args.files) {
      try {
        SecurityScanResult result = limiter.runOperation(OperationKind::Upload, [&] {
          return limiter.runWithTimeLimit(std::nullopt, [&](const Deadline& deadline) {
            ScanOptions opts;
            opts.scanContent = args.scanContent;
            opts.deadline = &deadline;
            return scanner.scan(file, opts);
          });
        });
        std::cout << toJson(result) << std::endl;

        if (!result.isSafe()) { exitCode = worse(exitCode, kUnsafe); continue; }
        if (!args.extract) continue;

        const fs::path target = scratch.createTempDirectory(jobId);
        ExtractOptions eo = ExtractOptions::fromConfig(cfg.security);
        ExtractionReport rep = limiter.runOperation(OperationKind::Extraction, target, [&] {
          return limiter.runWithTimeLimit(std::nullopt, [&](const Deadline& deadline) {
            eo.deadline = &deadline;
            return extractArchive(file, target, scanner, eo);
          });
        });
        std::cout << "{\"extracted\":\"" << jsonEscape(file) << "\",\"target\":\""
                  << jsonEscape(target.string()) << "\",\"files\":" << rep.filesWritten
                  << ",\"directories\":" << rep.directoriesCreated
                  << ",\"bytes\":" << rep.bytesWritten
                  << ",\"skipped\":" << rep.skipped.size() << "}" << std::endl;
      } catch (const ResourceLimitExceeded& e) {
        LOGE(file + ": " + e.what() + (e.retryable() ? " (retryable)" : ""));
        exitCode = worse(exitCode, kResourceLimit);
      } catch (const SecurityError& e) {
        LOGE(file + ": " + e.what());
        exitCode = worse(exitCode, kUnsafe);
      } catch (const fs::filesystem_error& e) {
        LOGE(file + ": " + e.what());
        exitCode = worse(exitCode, kUsage);
      }
    }

    scratch.cleanupJobFiles(jobId);
  } catch (const std::exception& e) {
    LOGE(std::string("fatal: ") + e.what());
    return worse(exitCode, kUsage);
  }
  return exitCode;
}
