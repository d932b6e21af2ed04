#pragma once
#include <map>
#include <string>

namespace ugate {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void setLogLevel(LogLevel lvl);
LogLevel logLevel();
bool parseLogLevel(const std::string& s, LogLevel& out);
const char* toString(LogLevel lvl);

// [LEVEL] YYYY-MM-DD HH:MM:SS | msg  -> stderr
void logEmit(LogLevel lvl, const std::string& msg);

// [LOG][eventType] id=scope k=v ...
void logEvent(const std::string& scope,
              const std::string& eventType,
              const std::map<std::string, std::string>& kv,
              LogLevel lvl = LogLevel::Info);

} // namespace ugate

#define LOGD(m) ::ugate::logEmit(::ugate::LogLevel::Debug, (m))
#define LOGI(m) ::ugate::logEmit(::ugate::LogLevel::Info,  (m))
#define LOGW(m) ::ugate::logEmit(::ugate::LogLevel::Warn,  (m))
#define LOGE(m) ::ugate::logEmit(::ugate::LogLevel::Error, (m))
