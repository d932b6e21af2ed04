// src/readers/ZipReader.cpp
#include "ugate/readers/ZipReader.hpp"

#include <algorithm>
#include <cstdio>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace ugate {

namespace {

std::string zipOpenError(int code) {
  zip_error_t ze;
  zip_error_init_with_code(&ze, code);
  std::string msg = zip_error_strerror(&ze);
  zip_error_fini(&ze);
  return msg;
}

// Owns a zip_file_t for the duration of one read.
struct ZipFileCloser {
  zip_file_t* f;
  ~ZipFileCloser() { if (f) zip_fclose(f); }
};

} // namespace

bool ZipReader::open(const fs::path& path, std::string& err) {
  close();
  int ze = 0;
  z_ = zip_open(path.string().c_str(), ZIP_RDONLY, &ze);
  if (!z_) { err = "zip_open failed: " + zipOpenError(ze); return false; }
  total_ = zip_get_num_entries(z_, 0);
  if (total_ < 0) { err = "zip_get_num_entries failed"; close(); return false; }
  idx_ = 0;
  return true;
}

bool ZipReader::countEntries(uint64_t /*limit*/, uint64_t& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  // central directory already knows; no iteration needed
  out = static_cast<uint64_t>(total_);
  return true;
}

bool ZipReader::nextEntry(EntryInfo& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  if (idx_ >= total_) return false;

  zip_stat_t st; zip_stat_init(&st);
  if (zip_stat_index(z_, static_cast<zip_uint64_t>(idx_), 0, &st) != 0) {
    err = std::string("zip_stat_index failed: ") + zip_strerror(z_);
    return false;
  }

  out = EntryInfo{};
  out.index = static_cast<uint64_t>(idx_);
  out.name = (st.valid & ZIP_STAT_NAME) && st.name ? st.name : "";
  out.size = (st.valid & ZIP_STAT_SIZE) ? static_cast<uint64_t>(st.size) : 0;
  out.compressedSize = (st.valid & ZIP_STAT_COMP_SIZE) ? static_cast<uint64_t>(st.comp_size) : 0;
  out.isDir = (!out.name.empty() && out.name.back() == '/');
  out.isEncrypted = (st.valid & ZIP_STAT_ENCRYPTION_METHOD) && st.encryption_method != ZIP_EM_NONE;

  zip_uint8_t opsys = 0;
  zip_uint32_t attr = 0;
  if (zip_file_get_external_attributes(z_, static_cast<zip_uint64_t>(idx_), 0, &opsys, &attr) == 0 &&
      opsys == ZIP_OPSYS_UNIX) {
    out.isSymlink = ((attr >> 16) & S_IFMT) == S_IFLNK;
  }

  idx_++;
  return true;
}

bool ZipReader::readEntry(const EntryInfo& e, uint64_t maxBytes,
                          std::vector<char>& out, std::string& err) {
  if (!z_) { err = "zip not open"; return false; }
  out.clear();
  ZipFileCloser zf{zip_fopen_index(z_, e.index, 0)};
  if (!zf.f) { err = std::string("zip_fopen_index failed: ") + zip_strerror(z_); return false; }

  std::vector<char> buf(1<<16);
  while (out.size() < maxBytes) {
    zip_uint64_t want = std::min<zip_uint64_t>(buf.size(), maxBytes - out.size());
    zip_int64_t n = zip_fread(zf.f, buf.data(), want);
    if (n < 0) { err = std::string("zip_fread failed: ") + zip_file_strerror(zf.f); return false; }
    if (n == 0) break;
    out.insert(out.end(), buf.data(), buf.data() + n);
  }
  return true;
}

bool ZipReader::extractEntry(const EntryInfo& e, const fs::path& dst,
                             uint64_t maxBytes, uint64_t& written, std::string& err) {
  written = 0;
  if (!z_) { err = "zip not open"; return false; }
  std::error_code ec;
  if (e.isDir) {
    fs::create_directories(dst, ec);
    if (ec) { err = "create_directories failed: " + ec.message(); return false; }
    return true;
  }

  fs::create_directories(dst.parent_path(), ec);
  ZipFileCloser zf{zip_fopen_index(z_, e.index, 0)};
  if (!zf.f) { err = std::string("zip_fopen_index failed: ") + zip_strerror(z_); return false; }

  FILE* fo = std::fopen(dst.string().c_str(), "wb");
  if (!fo) { err = "fopen failed: " + dst.string(); return false; }

  std::vector<char> buf(1<<16);
  bool ok = true;
  zip_int64_t n;
  while ((n = zip_fread(zf.f, buf.data(), buf.size())) > 0) {
    if (written + static_cast<uint64_t>(n) > maxBytes) {
      err = std::string(kEntryTooLarge) + std::to_string(maxBytes) + " bytes";
      ok = false;
      break;
    }
    if (std::fwrite(buf.data(), 1, (size_t)n, fo) != (size_t)n) {
      err = "fwrite failed: " + dst.string();
      ok = false;
      break;
    }
    written += static_cast<uint64_t>(n);
  }
  if (ok && n < 0) { err = std::string("zip_fread failed: ") + zip_file_strerror(zf.f); ok = false; }
  if (std::fclose(fo) != 0 && ok) { err = "fclose failed: " + dst.string(); ok = false; }
  return ok;
}

void ZipReader::close() {
  // read-only: discard instead of zip_close so nothing is ever written back
  if (z_) { zip_discard(z_); z_ = nullptr; }
  idx_ = 0;
  total_ = 0;
}

std::unique_ptr<IArchiveReader> makeZipReader() { return std::make_unique<ZipReader>(); }

} // namespace ugate
