// src/routing/router.cpp
#include "ugate/routing/router.hpp"
#include "ugate/log.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>

namespace fs = std::filesystem;

namespace ugate {

const char* toString(ContainerType t) {
  switch (t) {
    case ContainerType::Zip:    return "zip";
    case ContainerType::Jar:    return "jar";
    case ContainerType::TarGz:  return "tar_gz";
    case ContainerType::TarBz2: return "tar_bz2";
    default:                    return "";
  }
}

std::string extensionLower(const fs::path& p) {
  std::string e = p.extension().string();
  std::transform(e.begin(), e.end(), e.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return e;
}

bool isArchiveExtension(const std::string& memberName) {
  static const std::array<const char*, 8> kNested = {
    ".zip", ".jar", ".tar", ".gz", ".bz2", ".xz", ".7z", ".rar"
  };
  std::string e = extensionLower(fs::path(memberName));
  return std::find(kNested.begin(), kNested.end(), e) != kNested.end();
}

RoutingDecision routeByMagic(const unsigned char* head, size_t n, const std::string& extLower) {
  RoutingDecision rd{};
  // "PK\x03\x04" local header, "PK\x05\x06" empty archive
  if (n >= 4 && head[0] == 0x50 && head[1] == 0x4B &&
      ((head[2] == 0x03 && head[3] == 0x04) || (head[2] == 0x05 && head[3] == 0x06))) {
    rd.type = (extLower == ".jar") ? ContainerType::Jar : ContainerType::Zip;
  } else if (n >= 2 && head[0] == 0x1F && head[1] == 0x8B) {
    rd.type = ContainerType::TarGz;
  } else if (n >= 3 && head[0] == 'B' && head[1] == 'Z' && head[2] == 'h') {
    rd.type = ContainerType::TarBz2;
  } else {
    return rd;
  }
  rd.handler = toString(rd.type);
  rd.reason  = "magic";
  return rd;
}

RoutingDecision routeToHandler(const fs::path& path) {
  std::array<unsigned char, 4> buf{0,0,0,0};
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    LOGD("router: cannot open " + path.string());
    return RoutingDecision{};
  }
  f.read(reinterpret_cast<char*>(buf.data()), buf.size());
  return routeByMagic(buf.data(), (size_t)f.gcount(), extensionLower(path));
}

std::unique_ptr<IArchiveReader> makeReader(const RoutingDecision& rd, uint64_t streamBudget) {
  switch (rd.type) {
    case ContainerType::Zip:
    case ContainerType::Jar:    return makeZipReader();
    case ContainerType::TarGz:  return makeTarReader(TarCompression::Gzip, streamBudget);
    case ContainerType::TarBz2: return makeTarReader(TarCompression::Bzip2, streamBudget);
    default:                    return nullptr;
  }
}

} // namespace ugate
