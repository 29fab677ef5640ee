#include "config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <cctype>
#include <cstdlib>
#include <functional>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static bool parse_switch(const std::string& v, bool& out) {
  if (v == "on" || v == "true" || v == "1") { out = true; return true; }
  if (v == "off" || v == "false" || v == "0") { out = false; return true; }
  return false;
}

static bool parse_positive(const std::string& v, long& out) {
  if (v.empty()) return false;
  for (unsigned char c : v) if (!std::isdigit(c)) return false;
  char* end = nullptr;
  long n = std::strtol(v.c_str(), &end, 10);
  if (end == v.c_str() || *end != '\0' || n <= 0) return false;
  out = n;
  return true;
}

using SetHandler = std::function<bool(Config&, const std::string&, std::string&)>;

static SetHandler switch_handler(const char* key, bool Config::*field) {
  return [key, field](Config& cfg, const std::string& v, std::string& msg) {
    if (!parse_switch(v, cfg.*field)) { msg = std::string("set ") + key + ": use on|off"; return false; }
    return true;
  };
}

static SetHandler millis_handler(const char* key, std::chrono::milliseconds Config::*field) {
  return [key, field](Config& cfg, const std::string& v, std::string& msg) {
    long n = 0;
    if (!parse_positive(v, n)) { msg = std::string("set ") + key + ": value must be a positive number of milliseconds"; return false; }
    cfg.*field = std::chrono::milliseconds(n);
    return true;
  };
}

static const CommandRegistry<SetHandler>& set_table() {
  static const CommandRegistry<SetHandler> table = [] {
    CommandRegistry<SetHandler> t;
    t.register_command("toolchain", [](Config& cfg, const std::string& v, std::string& msg) {
      if (v.empty()) { msg = "set toolchain: missing program name"; return false; }
      cfg.toolchain = v;
      return true;
    });
    t.register_command("timeout", millis_handler("timeout", &Config::timeout));
    t.register_command("debounce", millis_handler("debounce", &Config::debounce));
    t.register_command("tick", millis_handler("tick", &Config::tick));
    t.register_command("marker", [](Config& cfg, const std::string& v, std::string&) {
      cfg.success_marker = v;
      return true;
    });
    t.register_command("autoadvance", switch_handler("autoadvance", &Config::auto_advance));
    t.register_command("watch", switch_handler("watch", &Config::watch));
    t.register_command("checkonchange", switch_handler("checkonchange", &Config::check_on_change));
    t.register_command("runonsave", switch_handler("runonsave", &Config::run_on_save));
    t.register_command("color", switch_handler("color", &Config::color));
    t.register_command("tabwidth", [](Config& cfg, const std::string& v, std::string& msg) {
      long n = 0;
      if (!parse_positive(v, n) || n > 16) { msg = "set tabwidth: width must be between 1 and 16"; return false; }
      cfg.tab_width = static_cast<int>(n);
      return true;
    });
    t.register_command("log_file", [](Config& cfg, const std::string& v, std::string& msg) {
      if (v.empty()) { msg = "set log_file: missing path"; return false; }
      cfg.log_file = v;
      return true;
    });
    t.register_command("log_level", [](Config& cfg, const std::string& v, std::string& msg) {
      static const char* levels[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
      for (const char* l : levels) {
        if (v == l) { cfg.log_level = v; return true; }
      }
      msg = "set log_level: use trace|debug|info|warn|error|critical|off";
      return false;
    });
    return t;
  }();
  return table;
}

bool apply_config_line(Config& cfg, const std::string& raw, std::string& msg) {
  std::string s = trim(raw);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s = trim(s.substr(1));
  if (s.compare(0, 4, "set ") != 0) { msg = "not a set command: " + s; return false; }
  s = trim(s.substr(4));
  size_t sp = s.find_first_of(" \t=");
  std::string key = sp == std::string::npos ? s : s.substr(0, sp);
  std::string value = sp == std::string::npos ? std::string() : trim(s.substr(sp + 1));
  if (!value.empty() && value[0] == '=') value = trim(value.substr(1));
  const SetHandler* h = set_table().find(key);
  if (!h) { msg = "unknown option: " + key; return false; }
  return (*h)(cfg, value, msg);
}

bool load_config_file(const std::filesystem::path& path, Config& cfg, std::vector<std::string>& messages) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return true;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(path, lines, msg)) { messages.push_back(msg); return false; }
  bool all_ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string err;
    if (!apply_config_line(cfg, lines[i], err)) {
      messages.push_back(path.string() + ":" + std::to_string(i + 1) + ": " + err);
      all_ok = false;
    }
  }
  return all_ok;
}

void load_config(const std::filesystem::path& root, Config& cfg, std::vector<std::string>& messages) {
  if (const char* home = std::getenv("HOME")) {
    load_config_file(std::filesystem::path(home) / TUTOR_RC_FILE, cfg, messages);
  }
  load_config_file(root / TUTOR_RC_FILE, cfg, messages);
}
