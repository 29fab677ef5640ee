#include "exercise.hpp"
#include "file_reader.hpp"
#include "config.hpp"
#include <cctype>
#include <set>

std::vector<RunMode> default_run_steps(const ExerciseDescriptor& ex) {
  std::vector<RunMode> steps{ex.mode};
  if (ex.lint && ex.mode != RunMode::Lint) steps.push_back(RunMode::Lint);
  return steps;
}

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

namespace {

struct PendingEntry {
  ExerciseDescriptor ex;
  std::string original;
  std::string solution;
  std::string work_dir;
  int line = 0;
};

}

static std::filesystem::path resolve(const std::filesystem::path& root, const std::string& p) {
  std::filesystem::path path(p);
  if (path.is_relative()) path = root / path;
  return path.lexically_normal();
}

bool ManifestExerciseSource::load(const std::filesystem::path& root, ManifestExerciseSource& out, std::string& msg) {
  std::string text;
  std::filesystem::path file = root / TUTOR_MANIFEST_FILE;
  if (!read_file_text(file, text, msg)) return false;
  return parse(text, root, out, msg);
}

bool ManifestExerciseSource::parse(const std::string& text, const std::filesystem::path& root,
                                   ManifestExerciseSource& out, std::string& msg) {
  out = ManifestExerciseSource();
  out.root_ = root;
  std::vector<PendingEntry> entries;
  std::vector<std::string> lines = split_lines(text);
  auto fail = [&](int line, const std::string& what) {
    msg = std::string(TUTOR_MANIFEST_FILE) + ":" + std::to_string(line) + ": " + what;
    return false;
  };

  for (size_t i = 0; i < lines.size(); ++i) {
    int lineno = static_cast<int>(i + 1);
    std::string s = trim(lines[i]);
    if (s.empty() || s[0] == '#') continue;
    if (s == "[exercise]") {
      entries.emplace_back();
      entries.back().line = lineno;
      continue;
    }
    if (entries.empty()) return fail(lineno, "expected [exercise] before '" + s + "'");
    size_t eq = s.find('=');
    if (eq == std::string::npos) return fail(lineno, "expected key = value");
    std::string key = trim(s.substr(0, eq));
    std::string value = trim(s.substr(eq + 1));
    PendingEntry& e = entries.back();
    if (key == "name") e.ex.id = value;
    else if (key == "path") e.ex.path = value;
    else if (key == "display") e.ex.display_name = value;
    else if (key == "hint") { if (!e.ex.hint.empty()) e.ex.hint += "\n"; e.ex.hint += value; }
    else if (key == "original") e.original = value;
    else if (key == "solution") e.solution = value;
    else if (key == "workdir") e.work_dir = value;
    else if (key == "mode") {
      if (value == "check") e.ex.mode = RunMode::Check;
      else if (value == "test") e.ex.mode = RunMode::Test;
      else return fail(lineno, "mode must be check|test");
    } else if (key == "lint") {
      if (value == "true") e.ex.lint = true;
      else if (value == "false") e.ex.lint = false;
      else return fail(lineno, "lint must be true|false");
    } else {
      return fail(lineno, "unknown key '" + key + "'");
    }
  }

  if (entries.empty()) { msg = std::string(TUTOR_MANIFEST_FILE) + ": no exercises"; return false; }
  std::set<std::string> seen;
  for (size_t i = 0; i < entries.size(); ++i) {
    PendingEntry& e = entries[i];
    if (e.ex.id.empty()) return fail(e.line, "exercise without name");
    if (e.ex.path.empty()) return fail(e.line, "exercise '" + e.ex.id + "' without path");
    if (!seen.insert(e.ex.id).second) return fail(e.line, "duplicate exercise '" + e.ex.id + "'");
    e.ex.ordinal = static_cast<int>(i);
    e.ex.path = resolve(root, e.ex.path.string());
    if (e.ex.display_name.empty()) e.ex.display_name = e.ex.id;
    e.ex.work_dir = e.work_dir.empty() ? root : resolve(root, e.work_dir);
    if (!e.original.empty()) out.originals_[e.ex.id] = resolve(root, e.original);
    if (!e.solution.empty()) out.solutions_[e.ex.id] = resolve(root, e.solution);
    out.exercises_.push_back(std::move(e.ex));
  }
  return true;
}

bool ManifestExerciseSource::original_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const {
  auto it = originals_.find(ex.id);
  if (it == originals_.end()) { msg = "no original text for " + ex.id; return false; }
  return read_file_text(it->second, out, msg);
}

bool ManifestExerciseSource::solution_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const {
  auto it = solutions_.find(ex.id);
  if (it == solutions_.end()) { msg = "no solution available for " + ex.id; return false; }
  return read_file_text(it->second, out, msg);
}

void InMemoryExerciseSource::add(ExerciseDescriptor ex, std::string original, std::string solution) {
  ex.ordinal = static_cast<int>(exercises_.size());
  if (ex.display_name.empty()) ex.display_name = ex.id;
  originals_[ex.id] = std::move(original);
  if (!solution.empty()) solutions_[ex.id] = std::move(solution);
  exercises_.push_back(std::move(ex));
}

bool InMemoryExerciseSource::original_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const {
  auto it = originals_.find(ex.id);
  if (it == originals_.end()) { msg = "no original text for " + ex.id; return false; }
  out = it->second;
  return true;
}

bool InMemoryExerciseSource::solution_text(const ExerciseDescriptor& ex, std::string& out, std::string& msg) const {
  auto it = solutions_.find(ex.id);
  if (it == solutions_.end()) { msg = "no solution available for " + ex.id; return false; }
  out = it->second;
  return true;
}
