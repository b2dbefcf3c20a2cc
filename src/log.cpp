#include "log.hpp"
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_write_mu;

void log_set_level(LogLevel level) { g_level.store(static_cast<int>(level)); }
LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }
bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

std::optional<LogLevel> parse_log_level(std::string_view s) {
  std::string v;
  for (char c : s) v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (v == "debug") return LogLevel::Debug;
  if (v == "info") return LogLevel::Info;
  if (v == "warn" || v == "warning") return LogLevel::Warn;
  if (v == "error") return LogLevel::Error;
  if (v == "off" || v == "none") return LogLevel::Off;
  return std::nullopt;
}

void log_init_from_env() {
  const char* env = std::getenv("PEDIT_LOG");
  if (!env) return;
  if (auto lv = parse_log_level(env)) log_set_level(*lv);
}

static const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off: break;
  }
  return "";
}

void log_write(LogLevel level, std::string_view message) {
  if (!log_enabled(level)) return;
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char ts[16];
  std::strftime(ts, sizeof(ts), "%H:%M:%S", &tm);
  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fprintf(stderr, "[%s] %s %.*s\n", level_tag(level), ts,
               static_cast<int>(message.size()), message.data());
}
