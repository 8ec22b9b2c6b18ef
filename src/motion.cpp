#include "motion.hpp"
#include <algorithm>
#include "classify.hpp"

int line_length(const Lines& lines, int row) {
  if (row < 0 || row >= static_cast<int>(lines.size())) return 0;
  return static_cast<int>(lines[row].size());
}

int max_normal_col(const Lines& lines, int row) {
  int len = line_length(lines, row);
  return len > 0 ? len - 1 : 0;
}

Position clamp_normal(const Lines& lines, Position p) {
  int max_row = std::max(0, static_cast<int>(lines.size()) - 1);
  p.row = std::clamp(p.row, 0, max_row);
  p.col = std::clamp(p.col, 0, max_normal_col(lines, p.row));
  return p;
}

Position motion_left(const Lines& lines, Position p, int count) {
  p = clamp_normal(lines, p);
  p.col = std::max(0, p.col - std::max(1, count));
  return p;
}

Position motion_right(const Lines& lines, Position p, int count) {
  p = clamp_normal(lines, p);
  p.col = std::min(max_normal_col(lines, p.row), p.col + std::max(1, count));
  return p;
}

Position motion_up(const Lines& lines, Position p, int count) {
  p.row = std::max(0, p.row - std::max(1, count));
  return clamp_normal(lines, p);
}

Position motion_down(const Lines& lines, Position p, int count) {
  int last = std::max(0, static_cast<int>(lines.size()) - 1);
  p.row = std::min(last, p.row + std::max(1, count));
  return clamp_normal(lines, p);
}

/*
w: skip the rest of the current word-char run, then the boundary run after it.
running off the line lands on the next line's column 0.
*/
static Position word_forward_once(const Lines& lines, Position p) {
  const std::string& line = lines[p.row];
  int len = static_cast<int>(line.size());
  int col = std::min(p.col, len);
  while (col < len && !is_word_boundary(line[col])) col++;
  while (col < len && is_word_boundary(line[col])) col++;
  if (col < len) { p.col = col; return p; }
  if (p.row + 1 < static_cast<int>(lines.size())) { p.row++; p.col = 0; return p; }
  p.col = max_normal_col(lines, p.row);
  return p;
}

static Position word_backward_once(const Lines& lines, Position p) {
  if (p.col > 0) {
    const std::string& line = lines[p.row];
    int col = std::min(p.col, static_cast<int>(line.size())) - 1;
    while (col > 0 && is_word_boundary(line[col])) col--;
    while (col > 0 && !is_word_boundary(line[col - 1])) col--;
    p.col = std::max(0, col);
    return p;
  }
  if (p.row > 0) {
    p.row--;
    p.col = max_normal_col(lines, p.row);
  }
  return p;
}

static Position word_end_once(const Lines& lines, Position p) {
  int rows = static_cast<int>(lines.size());
  int row = p.row;
  int col = p.col + 1;
  while (true) {
    const std::string& line = lines[row];
    int len = static_cast<int>(line.size());
    while (col < len && is_word_boundary(line[col])) col++;
    if (col < len) {
      while (col + 1 < len && !is_word_boundary(line[col + 1])) col++;
      return Position{row, col};
    }
    if (row + 1 >= rows) return Position{p.row == row ? p.row : row, max_normal_col(lines, row)};
    row++;
    col = 0;
  }
}

Position motion_word_forward(const Lines& lines, Position p, int count) {
  if (lines.empty()) return Position{};
  p = clamp_position(lines, p);
  for (int i = 0; i < std::max(1, count); ++i) {
    Position next = word_forward_once(lines, p);
    if (next == p) break;
    p = next;
  }
  return p;
}

Position motion_word_backward(const Lines& lines, Position p, int count) {
  if (lines.empty()) return Position{};
  p = clamp_position(lines, p);
  for (int i = 0; i < std::max(1, count); ++i) {
    Position next = word_backward_once(lines, p);
    if (next == p) break;
    p = next;
  }
  return p;
}

Position motion_word_end(const Lines& lines, Position p, int count) {
  if (lines.empty()) return Position{};
  p = clamp_position(lines, p);
  for (int i = 0; i < std::max(1, count); ++i) {
    Position next = word_end_once(lines, p);
    if (next == p) break;
    p = next;
  }
  return p;
}

Position motion_line_start(const Lines& lines, Position p) {
  p = clamp_normal(lines, p);
  p.col = 0;
  return p;
}

Position motion_line_end(const Lines& lines, Position p) {
  p = clamp_normal(lines, p);
  p.col = max_normal_col(lines, p.row);
  return p;
}

Position motion_first_non_blank(const Lines& lines, Position p) {
  p = clamp_normal(lines, p);
  if (!lines.empty()) p.col = first_non_blank(lines[p.row]);
  return p;
}

Position motion_goto_line(const Lines& lines, int line_number) {
  int total = std::max(1, static_cast<int>(lines.size()));
  int row = std::clamp(line_number, 1, total) - 1;
  return motion_first_non_blank(lines, Position{row, 0});
}

Position motion_last_line(const Lines& lines) {
  return motion_goto_line(lines, static_cast<int>(lines.size()));
}

static bool bracket_pair(char c, char& open, char& close, bool& forward) {
  switch (c) {
    case '(': open = '('; close = ')'; forward = true; return true;
    case '[': open = '['; close = ']'; forward = true; return true;
    case '{': open = '{'; close = '}'; forward = true; return true;
    case ')': open = '('; close = ')'; forward = false; return true;
    case ']': open = '['; close = ']'; forward = false; return true;
    case '}': open = '{'; close = '}'; forward = false; return true;
    default: return false;
  }
}

std::optional<Position> motion_match_bracket(const Lines& lines, Position p) {
  if (lines.empty()) return std::nullopt;
  p = clamp_normal(lines, p);
  const std::string& line = lines[p.row];
  char open = 0, close = 0;
  bool forward = true;
  int col = p.col;
  while (col < static_cast<int>(line.size()) && !bracket_pair(line[col], open, close, forward)) col++;
  if (col >= static_cast<int>(line.size())) return std::nullopt;

  int depth = 0;
  int row = p.row;
  int rows = static_cast<int>(lines.size());
  if (forward) {
    for (int r = row; r < rows; ++r) {
      const std::string& s = lines[r];
      for (int c = (r == row ? col : 0); c < static_cast<int>(s.size()); ++c) {
        if (s[c] == open) depth++;
        else if (s[c] == close && --depth == 0) return Position{r, c};
      }
    }
  } else {
    for (int r = row; r >= 0; --r) {
      const std::string& s = lines[r];
      for (int c = (r == row ? col : static_cast<int>(s.size()) - 1); c >= 0; --c) {
        if (s[c] == close) depth++;
        else if (s[c] == open && --depth == 0) return Position{r, c};
      }
    }
  }
  return std::nullopt;
}
