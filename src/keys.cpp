#include "keys.hpp"
#include <ncurses.h>

std::string key_symbol(int ch) {
  switch (ch) {
    case 27: return "Escape";
    case '\n': case '\r': case KEY_ENTER: return "Enter";
    case KEY_BACKSPACE: case 127: case 8: return "Backspace";
    case '\t': return "Tab";
    case KEY_DC: return "Delete";
    case KEY_UP: return "Up";
    case KEY_DOWN: return "Down";
    case KEY_LEFT: return "Left";
    case KEY_RIGHT: return "Right";
    case KEY_HOME: return "Home";
    case KEY_END: return "End";
    case KEY_PPAGE: return "PageUp";
    case KEY_NPAGE: return "PageDown";
    default: break;
  }
  if (ch >= 1 && ch <= 26) return std::string("Ctrl+") + static_cast<char>('a' + ch - 1);
  if (ch >= 32 && ch < 127) return std::string(1, static_cast<char>(ch));
  return std::string();
}
