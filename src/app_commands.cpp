#include "app.hpp"

void App::register_commands() {
  registry.register_command("w", [this](const std::vector<std::string>&, std::string& msg){
    bool ok = write_note();
    msg = message;
    return ok;
  });
  registry.register_command("q", [this](const std::vector<std::string>&, std::string& msg){
    quit(false);
    msg = message;
    return should_quit;
  });
  registry.register_command("q!", [this](const std::vector<std::string>&, std::string& msg){
    quit(true);
    msg.clear();
    return true;
  });
  registry.register_command("wq", [this](const std::vector<std::string>&, std::string& msg){
    if (!write_note()) { msg = message; return false; }
    quit(true);
    msg = message;
    return true;
  });
  registry.register_command("e", [this](const std::vector<std::string>& args, std::string& msg){
    if (args.empty()) { msg = "e: use :e <note>"; return false; }
    const BufferEngine* eng = session.engine();
    if (eng && eng->has_unsaved_changes()) { msg = "unsaved changes, use :w first"; return false; }
    open_note(args[0]);
    msg = message;
    return true;
  });
  // Every "set" key goes through the shared config parser, then reaches the open note.
  for (const char* key : {"write_mode", "tab_size", "history", "snapshot_interval",
                          "primary_color", "secondary_color", "tertiary_color"}) {
    std::string k = key;
    registry.register_command("set " + k, [this, k](const std::vector<std::string>& args, std::string& msg){
      if (!apply_setting(cfg, k, args, msg)) return false;
      session.apply_config(cfg);
      return true;
    });
  }
}
