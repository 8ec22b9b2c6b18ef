#pragma once
/*
 * RegisterStore
 *
 * Purpose: named text slots for yank/delete/paste.
 * Rule: whole-line captures end in '\n' and carry a linewise flag; paste inserts them as whole lines.
 *       The flag, not the text, decides: a charwise selection over a line break also ends in '\n'.
 * Note: unset registers read as empty text, never an error.
 */
#include <string>
#include <unordered_map>
#include "config.hpp"

class RegisterStore {
public:
  void capture(char name, const std::string& text, bool linewise = false);
  const std::string& get(char name) const;
  bool linewise(char name) const;

  // register used by the next capture/paste; reset after each completed command
  void select(char name) { active_ = name; }
  char active() const { return active_; }
  void reset_active() { active_ = VK_DEFAULT_REGISTER; }

  void capture_active(const std::string& text, bool linewise = false) { capture(active_, text, linewise); }
  const std::string& get_active() const { return get(active_); }
  bool active_linewise() const { return linewise(active_); }

private:
  struct Slot {
    std::string text;
    bool linewise = false;
  };
  std::unordered_map<char, Slot> slots_;
  char active_ = VK_DEFAULT_REGISTER;
};
