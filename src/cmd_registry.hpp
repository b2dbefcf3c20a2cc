#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch CLI subcommands.
 * Design: map name → handler (args vector, exit code); "recover list" style
 *         two-word names are looked up before single-word ones.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<int(const std::vector<std::string>&)>;
  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(usage), std::move(h)};
  }
  /* false when no command matches; rc receives the handler's exit code */
  bool execute(const std::vector<std::string>& words, int& rc) const {
    if (words.size() >= 2) {
      auto it = map_.find(words[0] + " " + words[1]);
      if (it != map_.end()) {
        rc = it->second.handler(std::vector<std::string>(words.begin() + 2, words.end()));
        return true;
      }
    }
    if (words.empty()) return false;
    auto it = map_.find(words[0]);
    if (it == map_.end()) return false;
    rc = it->second.handler(std::vector<std::string>(words.begin() + 1, words.end()));
    return true;
  }
  std::vector<std::string> usage_lines() const {
    std::vector<std::string> out;
    for (const auto& [name, e] : map_) out.push_back(name + (e.usage.empty() ? "" : " " + e.usage));
    return out;
  }
private:
  struct Entry { std::string usage; Handler handler; };
  std::map<std::string, Entry> map_;
};
