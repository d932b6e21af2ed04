#pragma once
#include "ugate/readers/IArchiveReader.hpp"
#include <zip.h>

namespace ugate {

class ZipReader : public IArchiveReader {
public:
  ZipReader() = default;
  ~ZipReader() override { close(); }
  ZipReader(const ZipReader&) = delete;
  ZipReader& operator=(const ZipReader&) = delete;

  bool open(const std::filesystem::path& path, std::string& err) override;
  bool countEntries(uint64_t limit, uint64_t& out, std::string& err) override;
  bool nextEntry(EntryInfo& out, std::string& err) override;
  bool readEntry(const EntryInfo& e, uint64_t maxBytes,
                 std::vector<char>& out, std::string& err) override;
  bool extractEntry(const EntryInfo& e, const std::filesystem::path& dst,
                    uint64_t maxBytes, uint64_t& written, std::string& err) override;
  bool perEntryCompression() const override { return true; }
  void close() override;

private:
  zip_t* z_ = nullptr;
  zip_int64_t idx_ = 0;     // next entry handed out by nextEntry
  zip_int64_t total_ = 0;
};

} // namespace ugate
