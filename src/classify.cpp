#include "classify.hpp"

bool is_word_boundary(char c) {
  switch (c) {
    case ' ': case '\t': case '\n': case '\r':
    case '.': case ',': case ';': case ':': case '!': case '?':
    case '"': case '\'':
    case '(': case ')': case '[': case ']': case '{': case '}': case '<': case '>':
      return true;
    default:
      return false;
  }
}

int indent_level(const std::string& line) {
  int width = 0;
  for (char c : line) {
    if (c == ' ') width += 1;
    else if (c == '\t') width += 4;
    else break;
  }
  return width / 4;
}

int first_non_blank(const std::string& line) {
  for (int i = 0; i < static_cast<int>(line.size()); ++i) {
    if (line[i] != ' ' && line[i] != '\t') return i;
  }
  return 0;
}
