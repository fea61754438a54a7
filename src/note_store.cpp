#include "note_store.hpp"
#include <fcntl.h>
#include <sys/stat.h>
#include <utility>
#include "file_reader.hpp"
#include "posix_fd.hpp"

FileNoteStore::FileNoteStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileNoteStore::path_for(const std::string& id) const {
  return root_ / std::filesystem::path(id);
}

bool FileNoteStore::exists(const std::string& id) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(id), ec);
}

bool FileNoteStore::read(const std::string& id, std::vector<std::uint8_t>& out, std::string& msg) const {
  return mmap_read_bytes(path_for(id), out, msg);
}

bool FileNoteStore::write(const std::string& id, std::span<const std::uint8_t> bytes, std::string& msg) {
  std::filesystem::path path = path_for(id);
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  if (!ufd.write_all(bytes.data(), bytes.size()) || !ufd.sync()) {
    msg = std::string("write file failed: ") + tmp.string();
    ufd.reset();
    std::error_code rm_ec;
    std::filesystem::remove(tmp, rm_ec);
    return false;
  }
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}

bool MemoryNoteStore::exists(const std::string& id) const { return notes_.count(id) != 0; }

bool MemoryNoteStore::read(const std::string& id, std::vector<std::uint8_t>& out, std::string& msg) const {
  auto it = notes_.find(id);
  if (it == notes_.end()) { msg = "no such note: " + id; return false; }
  out = it->second;
  msg = "opened note: " + id;
  return true;
}

bool MemoryNoteStore::write(const std::string& id, std::span<const std::uint8_t> bytes, std::string& msg) {
  notes_[id].assign(bytes.begin(), bytes.end());
  writes_++;
  msg = "saved note: " + id;
  return true;
}
