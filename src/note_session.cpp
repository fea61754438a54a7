#include "note_session.hpp"
#include <utility>
#include <vector>

NoteSession::NoteSession(INoteStore& store, const EngineConfig& cfg) : store_(store), cfg_(cfg) {}

bool NoteSession::open(const std::string& id, LoadError& err, std::string& msg) {
  err = LoadError::None;
  auto eng = std::make_unique<BufferEngine>(cfg_);
  if (!store_.exists(id)) {
    msg = "new note: " + id;
  } else {
    std::vector<std::uint8_t> bytes;
    if (!store_.read(id, bytes, msg)) return false;
    std::string m;
    if (!eng->load(bytes, err, m)) {
      msg = id + ": " + m;
      return false;
    }
    msg = id + ": " + m;
  }
  engine_ = std::move(eng);
  id_ = id;
  return true;
}

bool NoteSession::save(std::string& msg) {
  if (!engine_) { msg = "no note open"; return false; }
  if (!engine_->has_unsaved_changes()) { msg = "no changes to save"; return true; }
  std::vector<std::uint8_t> bytes = engine_->serialize();
  if (!store_.write(id_, bytes, msg)) return false;
  engine_->mark_saved();
  return true;
}

bool NoteSession::reload(LoadError& err, std::string& msg) {
  if (!engine_) { err = LoadError::None; msg = "no note open"; return false; }
  std::string id = id_;
  return open(id, err, msg);
}

void NoteSession::resize(int width, int height) {
  cfg_.width = width;
  cfg_.height = height;
  if (engine_) engine_->resize(width, height);
}

void NoteSession::apply_config(const EngineConfig& cfg) {
  int w = cfg_.width, h = cfg_.height;
  cfg_ = cfg;
  cfg_.width = w;
  cfg_.height = h;
  if (engine_) engine_->reconfigure(cfg_);
}

void NoteSession::close() {
  engine_.reset();
  id_.clear();
}
