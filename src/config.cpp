#include "config.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

/* decimal with an optional k/m/g suffix (binary multiples) */
static bool parse_size(const std::string& v, size_t& out) {
  if (v.empty()) return false;
  const size_t max = std::numeric_limits<size_t>::max();
  size_t i = 0;
  size_t n = 0;
  while (i < v.size() && std::isdigit((unsigned char)v[i])) {
    size_t d = static_cast<size_t>(v[i] - '0');
    if (n > (max - d) / 10) return false;
    n = n * 10 + d;
    i++;
  }
  if (i == 0) return false;
  if (i < v.size()) {
    if (i + 1 != v.size()) return false;
    unsigned shift = 0;
    switch (std::tolower((unsigned char)v[i])) {
      case 'k': shift = 10; break;
      case 'm': shift = 20; break;
      case 'g': shift = 30; break;
      default: return false;
    }
    if (n > (max >> shift)) return false;
    n <<= shift;
  }
  out = n;
  return true;
}

std::filesystem::path default_recovery_dir() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
    return std::filesystem::path(xdg) / "pedit" / "recovery";
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path(home) / ".local" / "share" / "pedit" / "recovery";
  }
  return std::filesystem::path("/tmp") / "pedit-recovery";
}

Config Config::defaults() {
  Config c;
  c.recovery_dir = default_recovery_dir();
  c.log_level = ::log_level();
  return c;
}

bool Config::apply_line(const std::string& raw, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s = trim(s.substr(1));

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  if (cmd != "set") { msg = "unknown command: " + cmd; return false; }
  std::string rest; std::getline(iss, rest);
  rest = trim(rest);
  std::string key, value;
  size_t eq = rest.find('=');
  if (eq != std::string::npos) {
    key = trim(rest.substr(0, eq));
    value = trim(rest.substr(eq + 1));
  } else {
    size_t sp = rest.find_first_of(" \t");
    key = rest.substr(0, sp);
    if (sp != std::string::npos) value = trim(rest.substr(sp));
  }
  if (key.empty() || value.empty()) { msg = "malformed setting: " + s; return false; }

  auto set_size = [&](size_t& field) {
    size_t v = 0;
    if (!parse_size(value, v)) { msg = "invalid size for " + key + ": " + value; return false; }
    field = v;
    return true;
  };
  if (key == "large_file_threshold") return set_size(large_file_threshold);
  if (key == "load_chunk_size") {
    size_t before = load_chunk_size;
    if (!set_size(load_chunk_size)) return false;
    if (load_chunk_size == 0) { load_chunk_size = before; msg = "load_chunk_size must be positive"; return false; }
    return true;
  }
  if (key == "chunked_recovery_threshold") return set_size(chunked_recovery_threshold);
  if (key == "data_channel_capacity") {
    size_t before = data_channel_capacity;
    if (!set_size(data_channel_capacity)) return false;
    if (data_channel_capacity == 0) { data_channel_capacity = before; msg = "data_channel_capacity must be positive"; return false; }
    return true;
  }
  if (key == "recovery_dir") {
    if (value.size() >= 2 && value[0] == '~' && value[1] == '/') {
      if (const char* home = std::getenv("HOME")) value = std::string(home) + value.substr(1);
    }
    recovery_dir = value;
    return true;
  }
  if (key == "log_level") {
    auto lv = parse_log_level(value);
    if (!lv) { msg = "invalid log level: " + value; return false; }
    log_level = *lv;
    return true;
  }
  msg = "unknown option: " + key;
  return false;
}

void Config::apply_text(const std::string& text) {
  int lineno = 0;
  for (const std::string& line : split_lines(text)) {
    lineno++;
    std::string msg;
    if (!apply_line(line, msg)) log_warn("peditrc line " + std::to_string(lineno) + ": " + msg);
  }
}

bool Config::load_rc(std::string& msg) {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return true;
  auto p = std::filesystem::path(home) / ".peditrc";
  if (!std::filesystem::exists(p, ec)) return true;
  std::string text;
  Error err;
  if (!mmap_read_file(p, text, err)) { msg = err.message; return false; }
  apply_text(text);
  return true;
}
