#pragma once
/*
 * Config
 *
 * Purpose: editor settings injected into BufferEngine at construction.
 * Defaults: compile-time BN_* macros below; override per user in ~/.boxnoterc
 *           with lines like "set write_mode=overwrite" or "set tab_size 2".
 */
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "color_tag.hpp"
#include "types.hpp"

#ifndef BN_DEFAULT_WIDTH
#define BN_DEFAULT_WIDTH 80
#endif

#ifndef BN_DEFAULT_HEIGHT
#define BN_DEFAULT_HEIGHT 24
#endif

#ifndef BN_HISTORY_CAPACITY
#define BN_HISTORY_CAPACITY 10
#endif

/*character edits between two undo snapshots*/
#ifndef BN_SNAPSHOT_INTERVAL
#define BN_SNAPSHOT_INTERVAL 10
#endif

#ifndef BN_TAB_SIZE
#define BN_TAB_SIZE 4
#endif

#define BN_RC_NAME ".boxnoterc"

struct EngineConfig {
  int width = BN_DEFAULT_WIDTH;
  int height = BN_DEFAULT_HEIGHT;
  std::size_t history_capacity = BN_HISTORY_CAPACITY;
  int snapshot_interval = BN_SNAPSHOT_INTERVAL;
  int tab_size = BN_TAB_SIZE;
  WriteMode write_mode = WriteMode::Insert;
  ColorTag primary_color = ColorTag::Blue;
  ColorTag secondary_color = ColorTag::Green;
  ColorTag tertiary_color = ColorTag::Red;

  ColorTag resolve(ActiveColor sel) const;
};

// Applies one "set" option. Returns false with msg on unknown key or bad value.
bool apply_setting(EngineConfig& cfg, const std::string& name, const std::vector<std::string>& args, std::string& msg);
// Runs one rc/command line ("set name=value"); blank and comment lines are accepted.
bool execute_config_line(EngineConfig& cfg, const std::string& line, std::string& msg);
bool load_rc(const std::filesystem::path& path, EngineConfig& cfg, std::string& msg);
std::filesystem::path default_rc_path();
