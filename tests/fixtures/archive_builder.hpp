#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace ugate::fixtures {

struct Member {
  enum Kind { File, Dir, Symlink };

  std::string name;
  std::string data;          // file content, or link target for Symlink
  Kind kind = File;
  bool store = false;        // zip only: no compression

  static Member file(std::string n, std::string d) { return Member{std::move(n), std::move(d)}; }
  static Member dir(std::string n) { return Member{std::move(n), "", Dir}; }
  static Member link(std::string n, std::string target) { return Member{std::move(n), std::move(target), Symlink}; }
};

// All writers throw std::runtime_error on failure.
void writeZip(const std::filesystem::path& out, const std::vector<Member>& members);

// GNU tar stream. Without endOfArchive the trailing zero blocks are left
// off so another stream can carry on from where this one stops.
std::string tarBytes(const std::vector<Member>& members, bool endOfArchive = true);

// One complete gzip or bzip2 stream holding bytes.
enum class Codec { Gzip, Bzip2 };
std::string compress(const std::string& bytes, Codec codec);

void writeTarGz(const std::filesystem::path& out, const std::vector<Member>& members);
void writeTarBz2(const std::filesystem::path& out, const std::vector<Member>& members);

void writeBytes(const std::filesystem::path& out, const std::string& bytes);

// Fresh directory under the system temp dir, removed with the object.
class ScratchDir {
public:
  ScratchDir();
  ~ScratchDir();
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  const std::filesystem::path& path() const { return path_; }
  std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
  std::filesystem::path path_;
};

} // namespace ugate::fixtures
