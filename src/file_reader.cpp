#include "file_reader.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include "posix_fd.hpp"

// Maps the file and hands the view to fn; empty files call fn with (nullptr, 0).
template <typename Fn>
static bool with_mapped_file(const std::filesystem::path& path, std::string& msg, Fn&& fn) {
  UniqueFd ufd(::open(path.string().c_str(), O_RDONLY));
  if (!ufd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(ufd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { fn(static_cast<const char*>(nullptr), n); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, ufd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  fn(data, n);
  ::munmap(mem, n);
  return true;
}

bool mmap_read_bytes(const std::filesystem::path& path,
                     std::vector<std::uint8_t>& out,
                     std::string& msg) {
  out.clear();
  bool ok = with_mapped_file(path, msg, [&](const char* data, size_t n) {
    if (n > 0) out.assign(reinterpret_cast<const std::uint8_t*>(data), reinterpret_cast<const std::uint8_t*>(data) + n);
  });
  if (ok) msg = std::string("opened file: ") + path.string();
  return ok;
}

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg) {
  out_lines.clear();
  bool ok = with_mapped_file(path, msg, [&](const char* data, size_t n) {
    size_t start = 0;
    for (size_t i = 0; i < n; ++i) {
      if (data[i] == '\n') {
        size_t end = i;
        if (end > start && data[end - 1] == '\r') end--;
        out_lines.emplace_back(data + start, end - start);
        start = i + 1;
      }
    }
    if (start < n) {
      size_t end = n;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data + start, end - start);
    }
  });
  if (!ok) return false;
  if (out_lines.empty()) out_lines.emplace_back("");
  msg = std::string("opened file: ") + path.string();
  return true;
}
