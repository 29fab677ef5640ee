#pragma once
/*
 * Events
 *
 * Everything the main loop reacts to besides its own key reads.
 */
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include "run_result.hpp"
#include "event_channel.hpp"

struct FileChanged { std::filesystem::path path; };
struct WatcherFailed {
  std::filesystem::path path;
  std::string message;
};
struct RunCompleted {
  std::string exercise_id;
  std::uint64_t generation = 0;
  RunResult result;
};

using Event = std::variant<FileChanged, WatcherFailed, RunCompleted>;
using EventQueue = EventChannel<Event>;
