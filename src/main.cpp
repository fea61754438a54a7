#include "app.hpp"
#include <filesystem>
#include <string>

// boxnote [note-file]: the note's directory is the store root, its name the note id.
int main(int argc, char** argv) {
  std::filesystem::path file = argc >= 2 ? std::filesystem::path(argv[1]) : std::filesystem::path("scratch.note");
  std::filesystem::path dir = file.has_parent_path() ? file.parent_path() : std::filesystem::current_path();
  App app(dir, file.filename().string());
  app.run();
  return 0;
}
