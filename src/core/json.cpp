// src/core/json.cpp
#include "ugate/core/json.hpp"

#include <cstdio>
#include <ctime>

namespace ugate {

std::string jsonEscape(const std::string& s) {
  std::string out; out.reserve(s.size() + 16);
  for (char c : s) {
    switch (c) {
      case '\"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\b': out += "\\b";  break;
      case '\f': out += "\\f";  break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if ((unsigned char)c < 0x20) {
          char buf[7]; std::snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
          out += buf;
        } else out += c;
    }
  }
  return out;
}

std::string isoTimestamp(Clock::time_point t) {
  std::time_t tt = Clock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static std::string quoted(const std::string& s) { return "\"" + jsonEscape(s) + "\""; }

std::string toJson(const SecurityScanResult& r) {
  std::string out = "{";
  out += "\"is_safe\":" + std::string(r.isSafe() ? "true" : "false");
  out += ",\"file_path\":" + (r.filePath ? quoted(r.filePath->string()) : std::string("null"));
  out += ",\"scanned_at\":" + quoted(isoTimestamp(r.scannedAt));
  out += ",\"total_files_scanned\":" + std::to_string(r.totalFilesScanned);
  out += ",\"total_size_scanned\":" + std::to_string(r.totalSizeScanned);
  out += ",\"threats\":[";
  bool first = true;
  for (const auto& t : r.threats()) {
    if (!first) out += ",";
    first = false;
    out += "{\"type\":" + quoted(toString(t.type));
    out += ",\"severity\":" + quoted(toString(t.severity));
    out += ",\"message\":" + quoted(t.message);
    out += ",\"timestamp\":" + quoted(isoTimestamp(t.timestamp));
    out += ",\"details\":{";
    bool firstKv = true;
    for (const auto& [k, v] : t.details) {
      if (!firstKv) out += ",";
      firstKv = false;
      out += quoted(k) + ":" + quoted(v);
    }
    out += "}}";
  }
  out += "]}";
  return out;
}

} // namespace ugate
