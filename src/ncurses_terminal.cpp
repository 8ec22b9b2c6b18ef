#include "ncurses_terminal.hpp"
#include <algorithm>

static constexpr short kErrorPair = 1;

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(kErrorPair, COLOR_RED, -1);
    } else {
      init_pair(kErrorPair, COLOR_RED, COLOR_BLACK); // fallback
    }
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  hl_start = std::min(hl_start, len);
  int hl_end = std::min(len, hl_start + hl_len);
  if (len == 0) {
    // an empty selected line shows one reversed cell
    if (hl_len > 0) { attron(A_REVERSE); mvaddch(row, col, ' '); attroff(A_REVERSE); }
    return;
  }
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) {
    mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
  }
}

void NcursesTerminal::draw_error(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kErrorPair));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kErrorPair));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}

int NcursesTerminal::read_key() { return getch(); }
