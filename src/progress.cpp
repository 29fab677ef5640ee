#include "progress.hpp"
#include "file_reader.hpp"
#include "file_writer.hpp"
#include <spdlog/spdlog.h>
#include <cctype>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

ProgressTracker::ProgressTracker(std::filesystem::path file, std::vector<std::string> ids)
    : file_(std::move(file)), ids_(std::move(ids)) {
  for (const auto& id : ids_) record_.entries[id] = ExerciseStatus::Pending;
}

ProgressRecord ProgressTracker::parse(const std::string& text) {
  ProgressRecord rec;
  for (const std::string& raw : split_lines(text)) {
    std::string s = trim(raw);
    if (s.empty() || s[0] == '#') continue;
    size_t eq = s.find('=');
    if (eq == std::string::npos) continue;
    std::string key = trim(s.substr(0, eq));
    std::string value = trim(s.substr(eq + 1));
    if (key.empty()) continue;
    if (key == "current") { rec.current = value; continue; }
    if (value == "done") rec.entries[key] = ExerciseStatus::Done;
    else if (value == "pending") rec.entries[key] = ExerciseStatus::Pending;
  }
  return rec;
}

std::string ProgressTracker::format(const ProgressRecord& rec, const std::vector<std::string>& order) {
  std::string out = "# tutor progress\n";
  if (!rec.current.empty()) out += "current = " + rec.current + "\n";
  auto line = [](const std::string& id, ExerciseStatus st) {
    return id + " = " + (st == ExerciseStatus::Done ? "done" : "pending") + "\n";
  };
  std::map<std::string, bool> written;
  for (const auto& id : order) {
    auto it = rec.entries.find(id);
    if (it == rec.entries.end()) continue;
    out += line(id, it->second);
    written[id] = true;
  }
  for (const auto& [id, st] : rec.entries) {
    if (!written.count(id)) out += line(id, st);
  }
  return out;
}

ProgressRecord ProgressTracker::load() {
  std::error_code ec;
  if (std::filesystem::exists(file_, ec)) {
    std::string text, msg;
    if (read_file_text(file_, text, msg)) {
      ProgressRecord parsed = parse(text);
      for (auto& [id, st] : parsed.entries) record_.entries[id] = st;
      record_.current = parsed.current;
      spdlog::info("loaded progress: {}/{} done", done_count(), total());
    } else {
      spdlog::warn("cannot read progress: {}", msg);
    }
  }
  dirty_ = false;
  return record_;
}

bool ProgressTracker::set_status(const std::string& id, ExerciseStatus st) {
  auto it = record_.entries.find(id);
  bool changed = it == record_.entries.end() || it->second != st;
  if (changed) {
    record_.entries[id] = st;
    dirty_ = true;
  }
  if (dirty_) persist();
  return changed;
}

bool ProgressTracker::mark_done(const std::string& id) {
  return set_status(id, ExerciseStatus::Done);
}

bool ProgressTracker::mark_pending(const std::string& id) {
  return set_status(id, ExerciseStatus::Pending);
}

bool ProgressTracker::is_done(const std::string& id) const {
  auto it = record_.entries.find(id);
  return it != record_.entries.end() && it->second == ExerciseStatus::Done;
}

void ProgressTracker::set_current(const std::string& id) {
  if (record_.current == id && !dirty_) return;
  record_.current = id;
  dirty_ = true;
  persist();
}

bool ProgressTracker::persist() {
  std::string msg;
  if (!write_file_atomic(file_, format(record_, ids_), msg)) {
    last_error_ = msg;
    spdlog::error("persist progress failed: {}", msg);
    dirty_ = true;
    return false;
  }
  last_error_.clear();
  dirty_ = false;
  return true;
}

int ProgressTracker::done_count() const {
  int n = 0;
  for (const auto& id : ids_) if (is_done(id)) n++;
  return n;
}

std::optional<size_t> ProgressTracker::next_pending_after(size_t index) const {
  size_t n = ids_.size();
  for (size_t step = 1; step < n; ++step) {
    size_t i = (index + step) % n;
    if (!is_done(ids_[i])) return i;
  }
  return std::nullopt;
}

std::optional<size_t> ProgressTracker::first_pending() const {
  for (size_t i = 0; i < ids_.size(); ++i) {
    if (!is_done(ids_[i])) return i;
  }
  return std::nullopt;
}
