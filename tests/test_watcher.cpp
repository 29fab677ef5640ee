#include "debouncer.hpp"
#include "file_watcher.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

using namespace std::chrono_literals;
namespace fs = std::filesystem;

static void test_debouncer() {
  Debouncer d(200ms);
  auto t0 = Debouncer::Clock::now();
  assert(!d.pending());
  assert(!d.ready(t0));
  assert(!d.time_until_ready(t0));

  d.notify(t0);
  d.notify(t0 + 50ms);
  d.notify(t0 + 120ms);
  assert(d.pending());
  assert(!d.ready(t0 + 250ms));
  assert(*d.time_until_ready(t0 + 220ms) == 100ms);
  assert(d.ready(t0 + 320ms));
  assert(!d.ready(t0 + 400ms));
  assert(!d.pending());

  d.notify(t0 + 500ms);
  d.reset();
  assert(!d.ready(t0 + 1000ms));
  assert(d.window() == 200ms);
}

static void write_file(const fs::path& p, const std::string& text) {
  std::ofstream out(p, std::ios::trunc);
  out << text;
}

static void test_inotify() {
  fs::path dir = fs::temp_directory_path() / ("tutor_watch_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  fs::path file = dir / "vars1.rs";
  write_file(file, "fn main() {}\n");

  EventQueue events;
  FileWatcher w(events, 100ms);
  std::string msg;
  assert(w.watch(file, msg));
  assert(w.watching());

  // a burst of saves is reported once
  write_file(file, "fn main() { let x = 1; }\n");
  write_file(file, "fn main() { let x = 2; }\n");
  write_file(file, "fn main() { let x = 3; }\n");
  Event ev;
  assert(events.pop_for(ev, 3000ms));
  auto* changed = std::get_if<FileChanged>(&ev);
  assert(changed);
  assert(changed->path == file);
  assert(!events.pop_for(ev, 400ms));

  // siblings in the same directory are ignored
  write_file(dir / "other.rs", "x");
  assert(!events.pop_for(ev, 400ms));

  // atomic replace (tmp + rename) counts as a change
  write_file(dir / "vars1.rs.tmp", "replaced\n");
  fs::rename(dir / "vars1.rs.tmp", file);
  assert(events.pop_for(ev, 3000ms));
  assert(std::holds_alternative<FileChanged>(ev));

  w.unwatch();
  assert(!w.watching());
  write_file(file, "after unwatch\n");
  assert(!events.pop_for(ev, 400ms));

  // deleting the watched file ends the watch
  assert(w.watch(file, msg));
  fs::remove(file);
  assert(events.pop_for(ev, 3000ms));
  auto* failed = std::get_if<WatcherFailed>(&ev);
  assert(failed);
  assert(failed->path == file);
  std::this_thread::sleep_for(50ms);
  assert(!w.watching());

  assert(!w.watch(dir / "no-such-dir" / "x.rs", msg));
  assert(!msg.empty());
  fs::remove_all(dir);
}

int main() {
  test_debouncer();
  test_inotify();
  return 0;
}
