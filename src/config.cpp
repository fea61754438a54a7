#include "config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include "cmd_registry.hpp"
#include "file_reader.hpp"

ColorTag EngineConfig::resolve(ActiveColor sel) const {
  switch (sel) {
    case ActiveColor::Primary: return primary_color;
    case ActiveColor::Secondary: return secondary_color;
    case ActiveColor::Tertiary: return tertiary_color;
    case ActiveColor::None: break;
  }
  return ColorTag::None;
}

static bool parse_positive(const std::string& s, int& out) {
  int v = 0;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size() || v < 1) return false;
  out = v;
  return true;
}

static void register_settings(CommandRegistry& registry, EngineConfig& cfg) {
  registry.register_command("set write_mode", [&cfg](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "set write_mode: use insert|overwrite"; return false; }
    if (args[0] == "insert") cfg.write_mode = WriteMode::Insert;
    else if (args[0] == "overwrite") cfg.write_mode = WriteMode::Overwrite;
    else { msg = "set write_mode: use insert|overwrite"; return false; }
    msg = "write_mode=" + args[0];
    return true;
  });
  registry.register_command("set tab_size", [&cfg](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.empty() || !parse_positive(args[0], v)) { msg = "set tab_size: size must be a number >= 1"; return false; }
    cfg.tab_size = v;
    msg = "tab_size=" + args[0];
    return true;
  });
  registry.register_command("set history", [&cfg](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.empty() || !parse_positive(args[0], v)) { msg = "set history: capacity must be a number >= 1"; return false; }
    cfg.history_capacity = static_cast<std::size_t>(v);
    msg = "history=" + args[0];
    return true;
  });
  registry.register_command("set snapshot_interval", [&cfg](const std::vector<std::string>& args, std::string& msg){
    int v = 0;
    if (args.empty() || !parse_positive(args[0], v)) { msg = "set snapshot_interval: interval must be a number >= 1"; return false; }
    cfg.snapshot_interval = v;
    msg = "snapshot_interval=" + args[0];
    return true;
  });
  auto color_setter = [&registry](const std::string& key, ColorTag& slot) {
    registry.register_command("set " + key, [key, &slot](const std::vector<std::string>& args, std::string& msg){
      ColorTag c;
      if (args.empty() || !color_tag_from_name(args[0], c) || c == ColorTag::None) {
        msg = "set " + key + ": unknown color";
        return false;
      }
      slot = c;
      msg = key + "=" + std::string(color_tag_name(c));
      return true;
    });
  };
  color_setter("primary_color", cfg.primary_color);
  color_setter("secondary_color", cfg.secondary_color);
  color_setter("tertiary_color", cfg.tertiary_color);
}

bool apply_setting(EngineConfig& cfg, const std::string& name, const std::vector<std::string>& args, std::string& msg) {
  CommandRegistry registry;
  register_settings(registry, cfg);
  return registry.execute("set " + name, args, msg);
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

bool execute_config_line(EngineConfig& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());
  std::string name;
  std::vector<std::string> args;
  split_command_line(s, name, args);
  CommandRegistry registry;
  register_settings(registry, cfg);
  return registry.execute(name, args, msg);
}

bool load_rc(const std::filesystem::path& path, EngineConfig& cfg, std::string& msg) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines;
  if (!mmap_read_lines(path, lines, msg)) return false;
  bool ok = true;
  std::string first_error;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string m;
    if (!execute_config_line(cfg, lines[i], m)) {
      if (ok) first_error = path.filename().string() + ":" + std::to_string(i + 1) + ": " + m;
      ok = false;
    }
  }
  msg = ok ? std::string("loaded ") + path.string() : first_error;
  return ok;
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / BN_RC_NAME;
}
