#include "file_writer.hpp"
#include "config.hpp"
#include "posix_fd.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace {

class ChunkWriter {
public:
  ChunkWriter(int fd, std::string& msg, const std::filesystem::path& tmp)
      : fd_(fd), msg_(msg), tmp_(tmp) { buf_.reserve(TUTOR_WRITE_CHUNK_SIZE); }

  bool append(std::string_view s) {
    if (s.size() >= TUTOR_WRITE_CHUNK_SIZE) {
      return flush() && write_span(s.data(), s.size());
    }
    if (buf_.size() + s.size() > TUTOR_WRITE_CHUNK_SIZE && !flush()) return false;
    buf_.append(s);
    return true;
  }

  bool flush() {
    if (buf_.empty()) return true;
    bool ok = write_span(buf_.data(), buf_.size());
    buf_.clear();
    return ok;
  }

private:
  bool write_span(const char* p, size_t len) {
    while (len > 0) {
      ssize_t w = ::write(fd_, p, len);
      if (w < 0) {
        if (errno == EINTR) continue;
        msg_ = std::string("write file failed: ") + tmp_.string() + " (" + std::strerror(errno) + ")";
        return false;
      }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  }

  int fd_;
  std::string& msg_;
  const std::filesystem::path& tmp_;
  std::string buf_;
};

template <typename Fill>
bool replace_file(const std::filesystem::path& path, std::string& msg, Fill fill) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  mode_t mode = 0644;
  struct stat st{};
  if (::stat(path.string().c_str(), &st) == 0) mode = st.st_mode & 07777;
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string() + " (" + std::strerror(errno) + ")";
    return false;
  }
  ChunkWriter w(ufd.get(), msg, tmp);
  if (!fill(w) || !w.flush()) {
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  }
  if (::fdatasync(ufd.get()) != 0) {
    msg = std::string("write file failed: ") + tmp.string();
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  }
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    msg = std::string("write file failed: ") + path.string() + " (" + ec.message() + ")";
    std::error_code ec2;
    std::filesystem::remove(tmp, ec2);
    return false;
  }
  msg = std::string("saved file: ") + path.string();
  return true;
}

}

bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg) {
  return replace_file(path, msg, [&](ChunkWriter& w) { return w.append(data); });
}

bool write_lines_atomic(const std::filesystem::path& path,
                        const std::vector<std::string>& lines,
                        bool trailing_newline,
                        std::string_view eol,
                        std::string& msg) {
  return replace_file(path, msg, [&](ChunkWriter& w) {
    for (size_t i = 0; i < lines.size(); ++i) {
      if (!w.append(lines[i])) return false;
      bool need_nl = (i + 1 < lines.size()) || trailing_newline;
      if (need_nl && !w.append(eol)) return false;
    }
    return true;
  });
}
