// src/readers/TarReader.cpp
#include "ugate/readers/TarReader.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cstdio>

namespace fs = std::filesystem;

namespace ugate {

namespace {
constexpr size_t kReadBlock = 10240;
}

std::string TarReader::lastError() const {
  const char* msg = a_ ? archive_error_string(a_) : nullptr;
  return msg ? msg : "unknown libarchive error";
}

bool TarReader::openHandle(std::string& err) {
  if (a_) { archive_read_free(a_); a_ = nullptr; }
  a_ = archive_read_new();
  if (!a_) { err = "archive_read_new failed"; return false; }

  archive_read_support_format_tar(a_);
  archive_read_support_format_gnutar(a_);
  int r = compression_ == TarCompression::Gzip ? archive_read_support_filter_gzip(a_)
                                               : archive_read_support_filter_bzip2(a_);
  // ARCHIVE_WARN means libarchive falls back to an external program
  if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
    err = "tar filter unavailable: " + lastError();
    archive_read_free(a_);
    a_ = nullptr;
    return false;
  }
  if (archive_read_open_filename(a_, path_.string().c_str(), kReadBlock) != ARCHIVE_OK) {
    err = "failed to open tar: " + lastError();
    archive_read_free(a_);
    a_ = nullptr;
    return false;
  }
  eof_ = false;
  nextIndex_ = 0;
  current_ = UINT64_MAX;
  remaining_ = 0;
  return true;
}

bool TarReader::open(const fs::path& path, std::string& err) {
  close();
  path_ = path;
  budgetHit_ = false;
  return openHandle(err);
}

// Filter 0 sits next to the tar parser, so its count is decompressed bytes.
bool TarReader::overBudget(std::string& err) {
  int64_t consumed = archive_filter_bytes(a_, 0);
  if (budgetHit_ || (consumed > 0 && (uint64_t)consumed > budget_)) {
    budgetHit_ = true;
    err = "decompressed stream exceeds " + std::to_string(budget_) + " bytes";
    return true;
  }
  return false;
}

int64_t TarReader::pull(char* buf, size_t n, std::string& err) {
  if (overBudget(err)) return -1;
  la_ssize_t got = archive_read_data(a_, buf, n);
  if (got < 0) { err = "tar data read failed: " + lastError(); return -1; }
  if (overBudget(err)) return -1;
  return (int64_t)got;
}

bool TarReader::finishCurrent(std::string& err) {
  if (current_ == UINT64_MAX) return true;
  // drain by hand so a huge member is cut off by the budget instead of skipped whole
  char buf[1<<14];
  while (remaining_ > 0) {
    int64_t got = pull(buf, (size_t)std::min<uint64_t>(remaining_, sizeof(buf)), err);
    if (got < 0) return false;
    if (got == 0) break;
    remaining_ -= std::min<uint64_t>(remaining_, (uint64_t)got);
  }
  remaining_ = 0;
  current_ = UINT64_MAX;
  return true;
}

bool TarReader::countEntries(uint64_t limit, uint64_t& out, std::string& err) {
  if (!a_) { err = "tar not open"; return false; }
  out = 0;
  EntryInfo e;
  while (out <= limit) {
    if (!nextEntry(e, err)) {
      if (!err.empty()) return false;
      break;
    }
    ++out;
  }
  // libarchive only streams forward: start over from the file
  return openHandle(err);
}

bool TarReader::nextEntry(EntryInfo& out, std::string& err) {
  if (!a_) { err = "tar not open"; return false; }
  if (eof_) return false;
  if (!finishCurrent(err)) return false;

  struct archive_entry* entry = nullptr;
  int r = archive_read_next_header(a_, &entry);
  if (r == ARCHIVE_EOF) { eof_ = true; return false; }
  if (overBudget(err)) return false;
  if (r == ARCHIVE_RETRY || r < ARCHIVE_WARN) {
    err = "tar header read failed: " + lastError();
    return false;
  }

  const char* name = archive_entry_pathname(entry);
  out = EntryInfo{};
  out.index = nextIndex_++;
  out.name = name ? name : "";
  out.size = archive_entry_size_is_set(entry) && archive_entry_size(entry) > 0
      ? (uint64_t)archive_entry_size(entry) : 0;
  out.compressedSize = 0;
  const mode_t type = archive_entry_filetype(entry);
  out.isDir = type == AE_IFDIR || (!out.name.empty() && out.name.back() == '/');
  out.isSymlink = type == AE_IFLNK || archive_entry_hardlink(entry) != nullptr;
  out.isEncrypted = archive_entry_is_encrypted(entry) != 0;

  current_ = out.index;
  remaining_ = out.size;
  return true;
}

bool TarReader::isCurrent(const EntryInfo& e, std::string& err) const {
  if (!a_) { err = "tar not open"; return false; }
  if (e.index != current_) { err = "tar entry " + e.name + " is no longer readable"; return false; }
  return true;
}

bool TarReader::readEntry(const EntryInfo& e, uint64_t maxBytes,
                          std::vector<char>& out, std::string& err) {
  out.clear();
  if (!isCurrent(e, err)) return false;
  uint64_t want = std::min(remaining_, maxBytes);
  out.resize((size_t)want);
  size_t have = 0;
  while (have < out.size()) {
    int64_t got = pull(out.data() + have, out.size() - have, err);
    if (got < 0) return false;
    if (got == 0) { err = "truncated tar data"; return false; }
    have += (size_t)got;
  }
  remaining_ -= want;
  return true;
}

bool TarReader::extractEntry(const EntryInfo& e, const fs::path& dst,
                             uint64_t maxBytes, uint64_t& written, std::string& err) {
  written = 0;
  if (!isCurrent(e, err)) return false;
  std::error_code ec;
  if (e.isDir) {
    fs::create_directories(dst, ec);
    if (ec) { err = "create_directories failed: " + ec.message(); return false; }
    return true;
  }
  // tar sizes are exact, so the ceiling can be checked up front
  if (remaining_ > maxBytes) { err = std::string(kEntryTooLarge) + std::to_string(maxBytes) + " bytes"; return false; }

  fs::create_directories(dst.parent_path(), ec);
  FILE* fo = std::fopen(dst.string().c_str(), "wb");
  if (!fo) { err = "fopen failed: " + dst.string(); return false; }

  char buf[1<<14];
  bool ok = true;
  while (remaining_ > 0) {
    int64_t got = pull(buf, (size_t)std::min<uint64_t>(remaining_, sizeof(buf)), err);
    if (got <= 0) { if (got == 0) err = "truncated tar data"; ok = false; break; }
    if (std::fwrite(buf, 1, (size_t)got, fo) != (size_t)got) { err = "fwrite failed: " + dst.string(); ok = false; break; }
    remaining_ -= (uint64_t)got;
    written += (uint64_t)got;
  }
  if (std::fclose(fo) != 0 && ok) { err = "fclose failed: " + dst.string(); ok = false; }
  return ok;
}

void TarReader::close() {
  if (a_) {
    archive_read_close(a_);
    archive_read_free(a_);
    a_ = nullptr;
  }
  current_ = UINT64_MAX;
  remaining_ = 0;
}

std::unique_ptr<IArchiveReader> makeTarReader(TarCompression compression, uint64_t streamBudget) {
  return std::make_unique<TarReader>(compression, streamBudget);
}

} // namespace ugate
