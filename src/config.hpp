#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults, overridable from ~/.tutorrc and <root>/.tutorrc.
 * Format: one `set <key> <value>` per line; `#`, `"` and `//` start comments.
 */
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#define TUTOR_DEFAULT_TOOLCHAIN "tutor-toolchain"
#define TUTOR_DEFAULT_TIMEOUT_MS 60000
#define TUTOR_DEFAULT_DEBOUNCE_MS 200
#define TUTOR_DEFAULT_TICK_MS 80
#define TUTOR_DEFAULT_SUCCESS_MARKER ""
#define TUTOR_DEFAULT_TAB_WIDTH 4
#define TUTOR_OUTPUT_CAPACITY (1u << 20)
#define TUTOR_CANCEL_GRACE_MS 500
#define TUTOR_WRITE_CHUNK_SIZE (1u << 16)

#define TUTOR_MANIFEST_FILE "exercises.manifest"
#define TUTOR_PROGRESS_FILE ".tutor-progress"
#define TUTOR_LOG_FILE ".tutor.log"
#define TUTOR_RC_FILE ".tutorrc"

struct Config {
  std::string toolchain = TUTOR_DEFAULT_TOOLCHAIN;
  std::chrono::milliseconds timeout{TUTOR_DEFAULT_TIMEOUT_MS};
  std::chrono::milliseconds debounce{TUTOR_DEFAULT_DEBOUNCE_MS};
  std::chrono::milliseconds tick{TUTOR_DEFAULT_TICK_MS};
  std::string success_marker = TUTOR_DEFAULT_SUCCESS_MARKER;
  bool auto_advance = true;
  bool watch = true;
  bool check_on_change = true;
  bool run_on_save = false;
  bool color = true;
  int tab_width = TUTOR_DEFAULT_TAB_WIDTH;
  std::string log_file;  // empty: <root>/.tutor.log
  std::string log_level = "info";
};

// Applies one rc line. Blank and comment lines succeed without effect.
bool apply_config_line(Config& cfg, const std::string& line, std::string& msg);

// Missing file is not an error. Problems on individual lines are appended to messages.
bool load_config_file(const std::filesystem::path& path, Config& cfg, std::vector<std::string>& messages);

// ~/.tutorrc, then <root>/.tutorrc
void load_config(const std::filesystem::path& root, Config& cfg, std::vector<std::string>& messages);
