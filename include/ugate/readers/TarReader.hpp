#pragma once
#include "ugate/readers/IArchiveReader.hpp"

struct archive;

namespace ugate {

// Streaming .tar.gz / .tar.bz2 reader on top of libarchive. Multi-member
// gzip and multi-stream bzip2 files decode as one tar stream. Every
// decompressed byte counts against streamBudget so a bomb cannot make
// enumeration run unbounded.
class TarReader : public IArchiveReader {
public:
  TarReader(TarCompression compression, uint64_t streamBudget)
    : compression_(compression), budget_(streamBudget) {}
  ~TarReader() override { close(); }

  bool open(const std::filesystem::path& path, std::string& err) override;
  bool countEntries(uint64_t limit, uint64_t& out, std::string& err) override;
  bool nextEntry(EntryInfo& out, std::string& err) override;
  bool readEntry(const EntryInfo& e, uint64_t maxBytes,
                 std::vector<char>& out, std::string& err) override;
  bool extractEntry(const EntryInfo& e, const std::filesystem::path& dst,
                    uint64_t maxBytes, uint64_t& written, std::string& err) override;
  bool perEntryCompression() const override { return false; }
  bool budgetExceeded() const override { return budgetHit_; }
  void close() override;

private:
  bool openHandle(std::string& err);
  int64_t pull(char* buf, size_t n, std::string& err);   // >0 bytes, 0 end of entry, -1 error
  bool overBudget(std::string& err);
  bool finishCurrent(std::string& err);
  bool isCurrent(const EntryInfo& e, std::string& err) const;
  std::string lastError() const;

  TarCompression compression_;
  uint64_t budget_;
  std::filesystem::path path_;
  struct archive* a_ = nullptr;
  bool budgetHit_ = false;
  bool eof_ = false;
  uint64_t nextIndex_ = 0;
  uint64_t current_ = UINT64_MAX;
  uint64_t remaining_ = 0;   // unread data bytes of current entry
};

} // namespace ugate
