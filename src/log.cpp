// src/log.cpp
#include "ugate/log.h"

#include <atomic>
#include <cctype>
#include <ctime>
#include <cstdio>
#include <mutex>

namespace ugate {

namespace {
std::atomic<int> gLevel{static_cast<int>(LogLevel::Info)};
std::mutex gSinkMu;
}

void setLogLevel(LogLevel lvl) { gLevel.store(static_cast<int>(lvl)); }

LogLevel logLevel() { return static_cast<LogLevel>(gLevel.load()); }

bool parseLogLevel(const std::string& s, LogLevel& out) {
  std::string l;
  for (char c : s) l.push_back((char)std::tolower((unsigned char)c));
  if (l == "debug")                   { out = LogLevel::Debug; return true; }
  if (l == "info")                    { out = LogLevel::Info;  return true; }
  if (l == "warn" || l == "warning")  { out = LogLevel::Warn;  return true; }
  if (l == "error")                   { out = LogLevel::Error; return true; }
  return false;
}

const char* toString(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO ";
}

void logEmit(LogLevel lvl, const std::string& msg) {
  if (static_cast<int>(lvl) < gLevel.load()) return;

  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  std::lock_guard<std::mutex> lk(gSinkMu);
  std::fprintf(stderr, "[%s] %s | %s\n", toString(lvl), ts, msg.c_str());
}

void logEvent(const std::string& scope,
              const std::string& eventType,
              const std::map<std::string, std::string>& kv,
              LogLevel lvl)
{
  if (static_cast<int>(lvl) < gLevel.load()) return;
  std::string line = "[LOG][" + eventType + "] id=" + scope;
  for (auto& [k, v] : kv) line += " " + k + "=" + v;
  logEmit(lvl, line);
}

} // namespace ugate
