#include "progress.hpp"
#include <cassert>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static const std::vector<std::string> kIds = {"intro1", "intro2", "vars1", "vars2"};

static void test_format_parse() {
  ProgressRecord rec;
  rec.current = "vars1";
  rec.entries["intro1"] = ExerciseStatus::Done;
  rec.entries["vars1"] = ExerciseStatus::Pending;
  rec.entries["intro2"] = ExerciseStatus::Done;
  std::string text = ProgressTracker::format(rec, kIds);
  assert(text == "# tutor progress\ncurrent = vars1\nintro1 = done\nintro2 = done\nvars1 = pending\n");
  assert(ProgressTracker::parse(text) == rec);

  ProgressRecord junk = ProgressTracker::parse("garbage\n = done\nx = maybe\ny=done\n");
  assert(junk.entries.size() == 1);
  assert(junk.entries["y"] == ExerciseStatus::Done);
}

static void test_tracker(const fs::path& dir) {
  fs::path file = dir / ".tutor-progress";
  {
    ProgressTracker p(file, kIds);
    ProgressRecord rec = p.load();
    assert(rec.entries.size() == 4);
    assert(p.done_count() == 0);
    assert(p.total() == 4);
    assert(!p.dirty());
    assert(p.first_pending() == 0u);

    assert(p.mark_done("intro1"));
    assert(!p.mark_done("intro1"));
    assert(p.is_done("intro1"));
    assert(!p.dirty());
    assert(fs::exists(file));
    p.set_current("intro2");
    assert(p.record().current == "intro2");
  }
  {
    ProgressTracker p(file, kIds);
    ProgressRecord rec = p.load();
    assert(rec.current == "intro2");
    assert(p.is_done("intro1"));
    assert(!p.is_done("intro2"));
    assert(p.done_count() == 1);
    assert(p.mark_pending("intro1"));
    assert(!p.is_done("intro1"));
  }
  {
    // ids that left the curriculum are kept but not counted
    ProgressTracker p(file, {"intro2"});
    p.load();
    assert(p.total() == 1);
    assert(p.done_count() == 0);
    assert(p.record().entries.count("vars2") == 1);
  }
}

static void test_next_pending() {
  ProgressTracker p(fs::path("/nonexistent-tutor-dir/.tutor-progress"), kIds);
  p.load();
  assert(p.next_pending_after(0) == 1u);
  assert(p.next_pending_after(3) == 0u);
  p.mark_done("intro2");
  p.mark_done("vars1");
  assert(p.next_pending_after(0) == 3u);
  assert(p.next_pending_after(3) == 0u);
  p.mark_done("intro1");
  // only the current one is left: nothing else to advance to
  assert(!p.next_pending_after(3).has_value());
  assert(p.first_pending() == 3u);
  p.mark_done("vars2");
  assert(!p.first_pending().has_value());
  assert(!p.next_pending_after(1).has_value());
}

static void test_persist_failure() {
  ProgressTracker p(fs::path("/nonexistent-tutor-dir/.tutor-progress"), kIds);
  p.load();
  assert(p.mark_done("intro1"));
  assert(p.dirty());
  assert(!p.last_error().empty());
  assert(!p.persist());
  assert(p.dirty());
  assert(p.is_done("intro1"));
}

int main() {
  fs::path dir = fs::temp_directory_path() / ("tutor_prog_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  test_format_parse();
  test_tracker(dir);
  test_next_pending();
  test_persist_failure();
  fs::remove_all(dir);
  return 0;
}
