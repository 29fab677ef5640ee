#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace {

class MappedFile {
public:
  MappedFile() = default;
  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;
  ~MappedFile() { if (mem_ && mem_ != MAP_FAILED) ::munmap(mem_, size_); }

  bool open(const std::filesystem::path& path, std::string& msg) {
    UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd.valid()) { msg = std::string("can not open file: ") + path.string() + " (" + std::strerror(errno) + ")"; return false; }
    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
    if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
    size_ = static_cast<size_t>(st.st_size);
    if (size_ == 0) return true;
    mem_ = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd.get(), 0);
    if (mem_ == MAP_FAILED) { mem_ = nullptr; msg = std::string("can not mmap file: ") + path.string(); return false; }
    (void)::madvise(mem_, size_, MADV_SEQUENTIAL);
    return true;
  }

  std::string_view view() const {
    if (!mem_) return {};
    return std::string_view(static_cast<const char*>(mem_), size_);
  }

private:
  void* mem_ = nullptr;
  size_t size_ = 0;
};

}

std::vector<std::string> split_lines(std::string_view data) {
  std::vector<std::string> out;
  size_t n = data.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out.emplace_back(data.substr(start, end - start));
      start = i + 1;
    }
  }
  size_t end = n;
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data.substr(start, end - start));
  return out;
}

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  MappedFile f;
  if (!f.open(path, msg)) return false;
  out_lines = split_lines(f.view());
  msg = std::string("opened file: ") + path.string();
  return true;
}

// Plain read(2): the file may be rewritten by another editor while we copy
// it, and a mapping truncated under us would fault.
bool read_file_text(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string() + " (" + std::strerror(errno) + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  out.reserve(static_cast<size_t>(st.st_size));
  char chunk[1 << 16];
  while (true) {
    ssize_t n = ::read(fd.get(), chunk, sizeof(chunk));
    if (n < 0) {
      if (errno == EINTR) continue;
      msg = std::string("can not read file: ") + path.string() + " (" + std::strerror(errno) + ")";
      out.clear();
      return false;
    }
    if (n == 0) break;
    out.append(chunk, static_cast<size_t>(n));
  }
  return true;
}

bool file_mtime(const std::filesystem::path& path, std::filesystem::file_time_type& out) {
  std::error_code ec;
  auto t = std::filesystem::last_write_time(path, ec);
  if (ec) return false;
  out = t;
  return true;
}
