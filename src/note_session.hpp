#pragma once
/*
 * NoteSession
 *
 * Purpose: the one open note; pairs a BufferEngine with the store it was read
 *          from. Opening another note replaces the engine entirely.
 */
#include <memory>
#include <string>
#include "buffer_engine.hpp"
#include "config.hpp"
#include "note_store.hpp"

class NoteSession {
public:
  NoteSession(INoteStore& store, const EngineConfig& cfg);

  // A missing note opens empty. On failure the current note stays open.
  bool open(const std::string& id, LoadError& err, std::string& msg);
  bool save(std::string& msg);
  bool reload(LoadError& err, std::string& msg);
  void resize(int width, int height);
  void apply_config(const EngineConfig& cfg);
  void close();

  bool is_open() const { return engine_ != nullptr; }
  BufferEngine* engine() { return engine_.get(); }
  const BufferEngine* engine() const { return engine_.get(); }
  const std::string& note_id() const { return id_; }
  const EngineConfig& config() const { return cfg_; }

private:
  INoteStore& store_;
  EngineConfig cfg_;
  std::unique_ptr<BufferEngine> engine_;
  std::string id_;
};
