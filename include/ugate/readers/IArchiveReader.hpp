#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ugate {

// One archive member as declared by the container (sizes are not verified).
struct EntryInfo {
  std::string name;
  uint64_t    index = 0;
  uint64_t    size = 0;            // declared uncompressed size
  uint64_t    compressedSize = 0;  // 0 when the container has no per-member compression
  bool        isDir = false;
  bool        isSymlink = false;   // symlink or hardlink
  bool        isEncrypted = false;
};

// Sequential reader over one container. Members come back in the
// container's native order; an entry's data is only readable until the
// next call to nextEntry (tar is a stream).
class IArchiveReader {
public:
  virtual ~IArchiveReader() = default;

  virtual bool open(const std::filesystem::path& path, std::string& err) = 0;

  // Member count, but stop counting after `limit + 1`.
  virtual bool countEntries(uint64_t limit, uint64_t& out, std::string& err) = 0;

  // false with empty err = no more entries.
  virtual bool nextEntry(EntryInfo& out, std::string& err) = 0;

  // Read at most maxBytes of the entry's data into out.
  virtual bool readEntry(const EntryInfo& e, uint64_t maxBytes,
                         std::vector<char>& out, std::string& err) = 0;

  // Write the entry to dst. Fails once more than maxBytes would be written;
  // `written` holds the bytes that actually hit the disk.
  virtual bool extractEntry(const EntryInfo& e, const std::filesystem::path& dst,
                            uint64_t maxBytes, uint64_t& written, std::string& err) = 0;

  // true when EntryInfo::compressedSize is meaningful.
  virtual bool perEntryCompression() const = 0;

  // Set when a hostile stream hit the decompressed-byte budget.
  virtual bool budgetExceeded() const { return false; }

  virtual void close() = 0;
};

// Prefix of the err text extractEntry reports when maxBytes would be passed.
inline constexpr char kEntryTooLarge[] = "entry exceeds ";

enum class TarCompression { Gzip, Bzip2 };

std::unique_ptr<IArchiveReader> makeZipReader();
std::unique_ptr<IArchiveReader> makeTarReader(TarCompression compression, uint64_t streamBudget);

} // namespace ugate
