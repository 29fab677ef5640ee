#pragma once
/*
 * ProgressTracker
 *
 * Purpose: exercise id → {Pending, Done}, plus the exercise to resume at.
 * File: `<root>/.tutor-progress`, a comment header, then `current = <id>` and
 * one `<id> = done|pending` line per exercise. Written temp → fsync → rename.
 * Failure: a failed persist is logged, the record stays dirty and the write
 * is retried on the next mutation or at shutdown.
 */
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class ExerciseStatus { Pending, Done };

struct ProgressRecord {
  std::map<std::string, ExerciseStatus> entries;
  std::string current;
  bool operator==(const ProgressRecord&) const = default;
};

class ProgressTracker {
public:
  ProgressTracker(std::filesystem::path file, std::vector<std::string> ids);

  // Missing file yields an all-pending record; unreadable lines are skipped.
  ProgressRecord load();
  bool mark_done(const std::string& id);
  bool mark_pending(const std::string& id);
  bool is_done(const std::string& id) const;
  void set_current(const std::string& id);
  bool persist();

  const ProgressRecord& record() const { return record_; }
  int done_count() const;
  int total() const { return static_cast<int>(ids_.size()); }
  bool dirty() const { return dirty_; }
  const std::string& last_error() const { return last_error_; }
  const std::filesystem::path& file() const { return file_; }

  // Next pending exercise after index, wrapping around; never index itself.
  std::optional<size_t> next_pending_after(size_t index) const;
  std::optional<size_t> first_pending() const;

  static std::string format(const ProgressRecord& rec, const std::vector<std::string>& order);
  static ProgressRecord parse(const std::string& text);

private:
  bool set_status(const std::string& id, ExerciseStatus st);

  std::filesystem::path file_;
  std::vector<std::string> ids_;
  ProgressRecord record_;
  bool dirty_ = false;
  std::string last_error_;
};
