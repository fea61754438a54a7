#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch named commands ("set tab_size", "w", "q!").
 * Design: map name → handler (args vector, status message); callers parse and route.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&, std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  // Returns false with msg when the command is unknown or its handler fails.
  bool execute(const std::string& name, const std::vector<std::string>& args, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown command: " + name; return false; }
    return it->second(args, msg);
  }
private:
  std::unordered_map<std::string, Handler> map_;
};

// Splits "set name=value rest" / "cmd a b" into the registry name and its args.
void split_command_line(const std::string& line, std::string& name, std::vector<std::string>& args);
