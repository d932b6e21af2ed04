// src/core/scratch_file.cpp
#include "ugate/core/scratch_file.hpp"
#include "ugate/core/types.hpp"   // randomSuffix
#include "ugate/log.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace ugate {

ScratchFile::ScratchFile(const std::string& tag) {
  const fs::path dir = fs::temp_directory_path();
  for (int attempt = 0; attempt < 8; ++attempt) {
    fs::path candidate = dir / ("ugate_" + tag + "_" + randomSuffix());
    int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd >= 0) {
      ::close(fd);
      path_ = std::move(candidate);
      return;
    }
    if (errno != EEXIST) {
      throw fs::filesystem_error("open", candidate, std::error_code(errno, std::generic_category()));
    }
  }
  throw fs::filesystem_error("open", dir, std::make_error_code(std::errc::file_exists));
}

ScratchFile::~ScratchFile() {
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) LOGW("scratch file not removed: " + path_.string() + ": " + ec.message());
}

} // namespace ugate
