#pragma once
/*
 * CommandRegistry
 *
 * Purpose: name → entry table shared by the command interpreter and the rc parser.
 * Design: aliases register the same entry under several names.
 */
#include <string>
#include <unordered_map>

template <typename Entry>
class CommandRegistry {
public:
  void register_command(const std::string& name, Entry e) { map_[name] = std::move(e); }
  void register_alias(const std::string& alias, const std::string& name) {
    auto it = map_.find(name);
    if (it != map_.end()) map_[alias] = it->second;
  }
  const Entry* find(const std::string& name) const {
    auto it = map_.find(name);
    if (it == map_.end()) return nullptr;
    return &it->second;
  }
  size_t size() const { return map_.size(); }
private:
  std::unordered_map<std::string, Entry> map_;
};
