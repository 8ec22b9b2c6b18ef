#include "edit.hpp"
#include <algorithm>
#include "classify.hpp"
#include "motion.hpp"

std::vector<std::string> split_text(const std::string& text) {
  std::vector<std::string> out;
  size_t st = 0;
  while (true) {
    size_t pos = text.find('\n', st);
    if (pos == std::string::npos) { out.push_back(text.substr(st)); break; }
    out.push_back(text.substr(st, pos - st));
    st = pos + 1;
  }
  return out;
}

static std::string join_lines(const std::vector<std::string>& lines, int r0, int r1) {
  std::string out;
  for (int r = r0; r <= r1; ++r) { out += lines[r]; out += '\n'; }
  return out;
}

static void ensure_not_empty(TextState& st) {
  if (st.lines.empty()) st.lines.push_back(std::string());
}

std::string text_in_range(const std::vector<std::string>& lines, Position start, Position end) {
  if (lines.empty()) return std::string();
  start = clamp_position(lines, start);
  end = clamp_position(lines, end);
  if (end < start) std::swap(start, end);
  if (start.row == end.row) return lines[start.row].substr(start.col, end.col - start.col);
  std::string out = lines[start.row].substr(start.col);
  for (int r = start.row + 1; r < end.row; ++r) { out += '\n'; out += lines[r]; }
  out += '\n';
  out += lines[end.row].substr(0, end.col);
  return out;
}

void erase_range(TextState& st, Position start, Position end) {
  if (st.lines.empty()) return;
  start = clamp_position(st.lines, start);
  end = clamp_position(st.lines, end);
  if (end < start) std::swap(start, end);
  if (start == end) return;
  if (start.row == end.row) {
    st.lines[start.row].erase(start.col, end.col - start.col);
  } else {
    std::string joined = st.lines[start.row].substr(0, start.col) + st.lines[end.row].substr(end.col);
    st.lines.erase(st.lines.begin() + start.row + 1, st.lines.begin() + end.row + 1);
    st.lines[start.row] = std::move(joined);
  }
  st.modified = true;
}

Position insert_text(TextState& st, Position at, const std::string& text) {
  ensure_not_empty(st);
  at = clamp_position(st.lines, at);
  auto parts = split_text(text);
  std::string& line = st.lines[at.row];
  std::string tail = line.substr(at.col);
  line = line.substr(0, at.col) + parts[0];
  st.modified = st.modified || !text.empty();
  if (parts.size() == 1) {
    line += tail;
    return Position{at.row, at.col + static_cast<int>(parts[0].size())};
  }
  int end_col = static_cast<int>(parts.back().size());
  parts.back() += tail;
  st.lines.insert(st.lines.begin() + at.row + 1, parts.begin() + 1, parts.end());
  return Position{at.row + static_cast<int>(parts.size()) - 1, end_col};
}

void delete_chars(TextState& st, RegisterStore& regs, int count) {
  if (st.lines.empty()) return;
  std::string& line = st.lines[st.cur.row];
  int len = static_cast<int>(line.size());
  if (st.cur.col >= len) return;
  int n = std::min(std::max(1, count), len - st.cur.col);
  regs.capture_active(line.substr(st.cur.col, n));
  line.erase(st.cur.col, n);
  st.modified = true;
  st.cur = clamp_normal(st.lines, st.cur);
}

void delete_chars_before(TextState& st, RegisterStore& regs, int count) {
  if (st.lines.empty() || st.cur.col == 0) return;
  std::string& line = st.lines[st.cur.row];
  int col = std::min(st.cur.col, static_cast<int>(line.size()));
  int n = std::min(std::max(1, count), col);
  if (n == 0) return;
  regs.capture_active(line.substr(col - n, n));
  line.erase(col - n, n);
  st.modified = true;
  st.cur.col = col - n;
  st.cur = clamp_normal(st.lines, st.cur);
}

void yank_lines(TextState& st, RegisterStore& regs, int row, int count) {
  if (st.lines.empty()) return;
  int r0 = std::clamp(row, 0, static_cast<int>(st.lines.size()) - 1);
  int r1 = std::min(static_cast<int>(st.lines.size()) - 1, r0 + std::max(1, count) - 1);
  regs.capture_active(join_lines(st.lines, r0, r1), true);
}

void delete_lines(TextState& st, RegisterStore& regs, int row, int count) {
  if (st.lines.empty()) return;
  int r0 = std::clamp(row, 0, static_cast<int>(st.lines.size()) - 1);
  int r1 = std::min(static_cast<int>(st.lines.size()) - 1, r0 + std::max(1, count) - 1);
  regs.capture_active(join_lines(st.lines, r0, r1), true);
  st.lines.erase(st.lines.begin() + r0, st.lines.begin() + r1 + 1);
  ensure_not_empty(st);
  st.modified = true;
  st.cur = motion_first_non_blank(st.lines, Position{std::min(r0, static_cast<int>(st.lines.size()) - 1), 0});
}

void change_lines(TextState& st, RegisterStore& regs, int row, int count) {
  if (st.lines.empty()) { ensure_not_empty(st); st.cur = Position{}; return; }
  int r0 = std::clamp(row, 0, static_cast<int>(st.lines.size()) - 1);
  int r1 = std::min(static_cast<int>(st.lines.size()) - 1, r0 + std::max(1, count) - 1);
  regs.capture_active(join_lines(st.lines, r0, r1), true);
  st.lines.erase(st.lines.begin() + r0 + 1, st.lines.begin() + r1 + 1);
  st.lines[r0].clear();
  st.modified = true;
  st.cur = Position{r0, 0};
}

void yank_range(TextState& st, RegisterStore& regs, Range r, bool linewise) {
  r = normalize(r);
  if (linewise) { yank_lines(st, regs, r.start.row, r.end.row - r.start.row + 1); return; }
  regs.capture_active(text_in_range(st.lines, r.start, r.end));
}

void delete_range(TextState& st, RegisterStore& regs, Range r, bool linewise) {
  r = normalize(r);
  if (linewise) { delete_lines(st, regs, r.start.row, r.end.row - r.start.row + 1); return; }
  std::string text = text_in_range(st.lines, r.start, r.end);
  if (text.empty()) return;
  regs.capture_active(text);
  erase_range(st, r.start, r.end);
  st.cur = clamp_position(st.lines, r.start);
}

static std::string block_slice(const std::string& line, int c0, int c1) {
  int len = static_cast<int>(line.size());
  if (c0 >= len) return std::string();
  return line.substr(c0, std::min(c1 + 1, len) - c0);
}

void yank_block(TextState& st, RegisterStore& regs, int r0, int r1, int c0, int c1) {
  if (st.lines.empty()) return;
  if (r1 < r0) std::swap(r0, r1);
  if (c1 < c0) std::swap(c0, c1);
  r1 = std::min(r1, static_cast<int>(st.lines.size()) - 1);
  std::string out;
  for (int r = r0; r <= r1; ++r) {
    if (r > r0) out += '\n';
    out += block_slice(st.lines[r], c0, c1);
  }
  regs.capture_active(out);
}

void delete_block(TextState& st, RegisterStore& regs, int r0, int r1, int c0, int c1) {
  if (st.lines.empty()) return;
  if (r1 < r0) std::swap(r0, r1);
  if (c1 < c0) std::swap(c0, c1);
  r1 = std::min(r1, static_cast<int>(st.lines.size()) - 1);
  yank_block(st, regs, r0, r1, c0, c1);
  for (int r = r0; r <= r1; ++r) {
    std::string& line = st.lines[r];
    int len = static_cast<int>(line.size());
    if (c0 >= len) continue;
    line.erase(c0, std::min(c1 + 1, len) - c0);
    st.modified = true;
  }
  st.cur = clamp_normal(st.lines, Position{r0, c0});
}

void delete_to_line_end(TextState& st, RegisterStore& regs) {
  if (st.lines.empty()) return;
  std::string& line = st.lines[st.cur.row];
  int col = std::min(st.cur.col, static_cast<int>(line.size()));
  if (col >= static_cast<int>(line.size())) return;
  regs.capture_active(line.substr(col));
  line.erase(col);
  st.modified = true;
  st.cur.col = col;
}

static std::vector<std::string> repeated_lines(const std::string& text, int count) {
  std::string body_text = text;
  if (!body_text.empty() && body_text.back() == '\n') body_text.pop_back();
  auto body = split_text(body_text);
  std::vector<std::string> out;
  for (int i = 0; i < std::max(1, count); ++i) out.insert(out.end(), body.begin(), body.end());
  return out;
}

static std::string repeated_text(const std::string& text, int count) {
  std::string out;
  for (int i = 0; i < std::max(1, count); ++i) out += text;
  return out;
}

static void paste_inline(TextState& st, Position at, const std::string& text) {
  Position end = insert_text(st, at, text);
  if (text.find('\n') == std::string::npos) st.cur = Position{at.row, std::max(at.col, end.col - 1)};
  else st.cur = at;
  st.cur = clamp_normal(st.lines, st.cur);
}

void paste_after(TextState& st, const std::string& text, bool linewise, int count) {
  if (text.empty()) return;
  ensure_not_empty(st);
  if (linewise) {
    auto block = repeated_lines(text, count);
    int row = st.cur.row + 1;
    st.lines.insert(st.lines.begin() + row, block.begin(), block.end());
    st.modified = true;
    st.cur = motion_first_non_blank(st.lines, Position{row, 0});
    return;
  }
  int len = static_cast<int>(st.lines[st.cur.row].size());
  int col = len == 0 ? 0 : std::min(st.cur.col + 1, len);
  paste_inline(st, Position{st.cur.row, col}, repeated_text(text, count));
}

void paste_before(TextState& st, const std::string& text, bool linewise, int count) {
  if (text.empty()) return;
  ensure_not_empty(st);
  if (linewise) {
    auto block = repeated_lines(text, count);
    int row = st.cur.row;
    st.lines.insert(st.lines.begin() + row, block.begin(), block.end());
    st.modified = true;
    st.cur = motion_first_non_blank(st.lines, Position{row, 0});
    return;
  }
  paste_inline(st, clamp_position(st.lines, st.cur), repeated_text(text, count));
}

void open_line_below(TextState& st) {
  ensure_not_empty(st);
  int row = std::min(st.cur.row, static_cast<int>(st.lines.size()) - 1) + 1;
  st.lines.insert(st.lines.begin() + row, std::string());
  st.modified = true;
  st.cur = Position{row, 0};
}

void open_line_above(TextState& st) {
  ensure_not_empty(st);
  int row = std::clamp(st.cur.row, 0, static_cast<int>(st.lines.size()) - 1);
  st.lines.insert(st.lines.begin() + row, std::string());
  st.modified = true;
  st.cur = Position{row, 0};
}

bool replace_chars(TextState& st, char ch, int count) {
  if (st.lines.empty()) return false;
  std::string& line = st.lines[st.cur.row];
  int n = std::max(1, count);
  if (st.cur.col + n > static_cast<int>(line.size())) return false;
  for (int i = 0; i < n; ++i) line[st.cur.col + i] = ch;
  st.cur.col += n - 1;
  st.modified = true;
  return true;
}

std::optional<char> replace_char_advance(TextState& st, char ch) {
  ensure_not_empty(st);
  std::string& line = st.lines[st.cur.row];
  int col = std::clamp(st.cur.col, 0, static_cast<int>(line.size()));
  std::optional<char> original;
  if (col < static_cast<int>(line.size())) {
    original = line[col];
    line[col] = ch;
  } else {
    line.push_back(ch);
  }
  st.cur.col = col + 1;
  st.modified = true;
  return original;
}

void replace_char_undo(TextState& st, std::optional<char> original) {
  ensure_not_empty(st);
  std::string& line = st.lines[st.cur.row];
  int col = std::min(st.cur.col, static_cast<int>(line.size())) - 1;
  if (col < 0) return;
  if (original) line[col] = *original;
  else line.erase(col, 1);
  st.cur.col = col;
  st.modified = true;
}
