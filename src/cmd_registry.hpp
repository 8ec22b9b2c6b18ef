#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch ex commands.
 * Design: map name → handler (argument text); Interpreter parses and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include "ex_command.hpp"

class CommandRegistry {
public:
  using Handler = std::function<ExStatus(const std::string&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void register_alias(const std::string& alias, const std::string& name) {
    auto it = map_.find(name);
    if (it != map_.end()) map_[alias] = it->second;
  }
  bool execute(const std::string& name, const std::string& args, ExStatus& status) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    status = it->second(args);
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
