#include "file_watcher.hpp"
#include "debouncer.hpp"
#include <spdlog/spdlog.h>
#include <sys/inotify.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

static constexpr uint32_t kDirMask = IN_CLOSE_WRITE | IN_MODIFY | IN_MOVED_TO | IN_CREATE |
                                     IN_DELETE | IN_MOVED_FROM | IN_DELETE_SELF | IN_MOVE_SELF;

FileWatcher::FileWatcher(EventQueue& events, std::chrono::milliseconds debounce)
    : events_(events), debounce_(debounce) {}

FileWatcher::~FileWatcher() { unwatch(); }

bool FileWatcher::watching() const { return running_.load(); }

bool FileWatcher::watch(const std::filesystem::path& file, std::string& msg) {
  unwatch();
  std::filesystem::path abs = std::filesystem::absolute(file).lexically_normal();
  std::filesystem::path dir = abs.parent_path();
  UniqueFd ino(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
  if (!ino.valid()) {
    msg = std::string("watcher unavailable: ") + std::strerror(errno);
    spdlog::warn("{}", msg);
    return false;
  }
  if (::inotify_add_watch(ino.get(), dir.string().c_str(), kDirMask) < 0) {
    msg = "cannot watch " + dir.string() + ": " + std::strerror(errno);
    spdlog::warn("{}", msg);
    return false;
  }
  UniquePipe wake;
  if (!make_pipe(wake, O_NONBLOCK)) {
    msg = std::string("watcher unavailable: ") + std::strerror(errno);
    spdlog::warn("{}", msg);
    return false;
  }
  inotify_ = std::move(ino);
  wake_ = std::move(wake);
  running_.store(true);
  thread_ = std::thread(&FileWatcher::loop, this, inotify_.get(), wake_.read_end.get(), abs);
  spdlog::info("watching {}", abs.string());
  return true;
}

void FileWatcher::unwatch() {
  if (thread_.joinable()) {
    char b = 'q';
    (void)!::write(wake_.write_end.get(), &b, 1);
    thread_.join();
  }
  running_.store(false);
  inotify_.reset();
  wake_.read_end.reset();
  wake_.write_end.reset();
}

void FileWatcher::fail(const std::filesystem::path& file, const std::string& message) {
  spdlog::error("watcher: {}", message);
  running_.store(false);
  events_.push(WatcherFailed{file, message});
}

void FileWatcher::loop(int inotify_fd, int wake_fd, std::filesystem::path file) {
  const std::string name = file.filename().string();
  Debouncer debouncer(debounce_);
  alignas(struct inotify_event) char buf[8192];

  while (true) {
    auto wait = debouncer.time_until_ready(Debouncer::Clock::now());
    int timeout_ms = wait ? static_cast<int>(wait->count()) + 1 : -1;
    pollfd fds[2] = {{inotify_fd, POLLIN, 0}, {wake_fd, POLLIN, 0}};
    int pr = ::poll(fds, 2, timeout_ms);
    if (pr < 0) {
      if (errno == EINTR) continue;
      fail(file, std::string("poll failed: ") + std::strerror(errno));
      return;
    }
    if (fds[1].revents) return;

    if (fds[0].revents & POLLIN) {
      while (true) {
        ssize_t n = ::read(inotify_fd, buf, sizeof buf);
        if (n < 0) {
          if (errno == EINTR) continue;
          if (errno == EAGAIN) break;
          fail(file, std::string("read failed: ") + std::strerror(errno));
          return;
        }
        if (n == 0) break;
        for (char* p = buf; p < buf + n;) {
          auto* ev = reinterpret_cast<struct inotify_event*>(p);
          p += sizeof(struct inotify_event) + ev->len;
          if (ev->mask & IN_Q_OVERFLOW) {
            debouncer.notify(Debouncer::Clock::now());
            continue;
          }
          if (ev->mask & (IN_IGNORED | IN_DELETE_SELF | IN_MOVE_SELF | IN_UNMOUNT)) {
            fail(file, "directory of " + file.string() + " is gone");
            return;
          }
          if (ev->len > 0 && name == ev->name) {
            spdlog::debug("watcher: event 0x{:x} on {}", ev->mask, name);
            debouncer.notify(Debouncer::Clock::now());
          }
        }
      }
    } else if (fds[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
      fail(file, "inotify descriptor failed");
      return;
    }

    if (debouncer.ready(Debouncer::Clock::now())) {
      std::error_code ec;
      if (!std::filesystem::exists(file, ec)) {
        fail(file, file.string() + " was removed");
        return;
      }
      events_.push(FileChanged{file});
    }
  }
}
