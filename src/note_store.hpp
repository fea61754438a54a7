#pragma once
/*
 * NoteStore
 *
 * Purpose: raw byte persistence of notes, keyed by a note id.
 * FileNoteStore: id is a path relative to the notes directory; writes are safe
 *                (write .tmp → fdatasync → atomic rename).
 * MemoryNoteStore: map-backed store for tests and scratch notes.
 */
#include <cstdint>
#include <filesystem>
#include <map>
#include <utility>
#include <span>
#include <string>
#include <vector>

class INoteStore {
public:
  virtual ~INoteStore() = default;
  virtual bool exists(const std::string& id) const = 0;
  virtual bool read(const std::string& id, std::vector<std::uint8_t>& out, std::string& msg) const = 0;
  virtual bool write(const std::string& id, std::span<const std::uint8_t> bytes, std::string& msg) = 0;
};

class FileNoteStore : public INoteStore {
public:
  explicit FileNoteStore(std::filesystem::path root);
  bool exists(const std::string& id) const override;
  bool read(const std::string& id, std::vector<std::uint8_t>& out, std::string& msg) const override;
  bool write(const std::string& id, std::span<const std::uint8_t> bytes, std::string& msg) override;
  std::filesystem::path path_for(const std::string& id) const;
  const std::filesystem::path& root() const { return root_; }
private:
  std::filesystem::path root_;
};

class MemoryNoteStore : public INoteStore {
public:
  bool exists(const std::string& id) const override;
  bool read(const std::string& id, std::vector<std::uint8_t>& out, std::string& msg) const override;
  bool write(const std::string& id, std::span<const std::uint8_t> bytes, std::string& msg) override;
  void put(const std::string& id, std::vector<std::uint8_t> bytes) { notes_[id] = std::move(bytes); }
  int write_count() const { return writes_; }
private:
  std::map<std::string, std::vector<std::uint8_t>> notes_;
  int writes_ = 0;
};
