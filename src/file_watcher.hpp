#pragma once
/*
 * FileWatcher
 *
 * Purpose: notice edits to the active exercise file made outside tutor.
 * Design: inotify on the file's directory (so rename-over saves are seen),
 * events filtered by file name, bursts coalesced by a Debouncer, results
 * posted to the event queue from a background thread.
 * Failure: backend errors are logged and posted as WatcherFailed; the watch
 * then stops. Never fatal.
 */
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include "events.hpp"
#include "posix_fd.hpp"

class IWatchService {
public:
  virtual ~IWatchService() = default;
  // Replaces any current subscription. False with msg when the backend refuses.
  virtual bool watch(const std::filesystem::path& file, std::string& msg) = 0;
  virtual void unwatch() = 0;
  virtual bool watching() const = 0;
};

class FileWatcher : public IWatchService {
public:
  FileWatcher(EventQueue& events, std::chrono::milliseconds debounce);
  ~FileWatcher() override;
  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  bool watch(const std::filesystem::path& file, std::string& msg) override;
  void unwatch() override;
  bool watching() const override;

private:
  void loop(int inotify_fd, int wake_fd, std::filesystem::path file);
  void fail(const std::filesystem::path& file, const std::string& message);

  EventQueue& events_;
  std::chrono::milliseconds debounce_;
  UniqueFd inotify_;
  UniquePipe wake_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};
