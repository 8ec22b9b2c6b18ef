#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses screen setup/teardown.
 * Usage: construct in main before any NcursesTerminal; check ok(); destructor restores the tty.
 * Note: raw mode, so Ctrl+c/Ctrl+z/Ctrl+o arrive as keys instead of signals or tty controls.
 */
#include <ncurses.h>
#include <string>

class Terminal {
public:
  explicit Terminal(int esc_delay_ms = 25);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;

  bool ok() const { return screen_ != nullptr; }
  const std::string& error() const { return error_; }

private:
  SCREEN* screen_ = nullptr;
  std::string error_;
};
