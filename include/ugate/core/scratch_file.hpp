#pragma once
#include <filesystem>
#include <string>

namespace ugate {

// Empty file in the system temp dir that is removed with its owner. The name
// ugate_<tag>_<hex> is claimed with O_EXCL | O_NOFOLLOW at 0600, so nothing
// planted in the shared directory is ever written through.
// Throws std::filesystem::filesystem_error when no name can be claimed.
class ScratchFile {
public:
  explicit ScratchFile(const std::string& tag);
  ~ScratchFile();
  ScratchFile(const ScratchFile&) = delete;
  ScratchFile& operator=(const ScratchFile&) = delete;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace ugate
