#include "terminal.hpp"
#include <cstdio>
#include <locale.h>
#include <unistd.h>

Terminal::Terminal(int esc_delay_ms) {
  setlocale(LC_ALL, "");
  if (!isatty(STDIN_FILENO) || !isatty(STDOUT_FILENO)) {
    error_ = "vimkeys: stdin and stdout must be a terminal";
    return;
  }
  // newterm reports failure instead of exiting like initscr
  screen_ = newterm(nullptr, stdout, stdin);
  if (!screen_) {
    error_ = "vimkeys: can not initialize terminal (check TERM)";
    return;
  }
  set_term(screen_);
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  set_escdelay(esc_delay_ms);
}

Terminal::~Terminal() {
  if (!screen_) return;
  endwin();
  delscreen(screen_);
}
