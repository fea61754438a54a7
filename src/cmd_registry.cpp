#include "cmd_registry.hpp"
#include <sstream>
#include <utility>

void split_command_line(const std::string& line, std::string& name, std::vector<std::string>& args) {
  name.clear();
  args.clear();
  std::istringstream iss(line);
  std::string cmd; iss >> cmd;
  std::vector<std::string> words; std::string a; while (iss >> a) words.push_back(a);
  if (cmd == "set" && !words.empty()) {
    std::string opt = words[0];
    std::string value;
    size_t eq = opt.find('=');
    if (eq != std::string::npos) {
      value = opt.substr(eq + 1);
      opt = opt.substr(0, eq);
    }
    name = "set " + opt;
    if (!value.empty()) args.push_back(value);
    for (size_t i = 1; i < words.size(); ++i) args.push_back(words[i]);
    return;
  }
  name = cmd;
  args = std::move(words);
}
