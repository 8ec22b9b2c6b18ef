#include "search.hpp"
#include <algorithm>
#include <cctype>
#include "classify.hpp"

static std::string fold(const std::string& s) {
  std::string out = s;
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

static std::vector<int> kmp_build(const std::string& pat) {
  std::vector<int> pi(pat.size(), 0);
  for (size_t i = 1, j = 0; i < pat.size(); ++i) {
    while (j > 0 && pat[i] != pat[j]) j = pi[j - 1];
    if (pat[i] == pat[j]) ++j;
    pi[i] = (int)j;
  }
  return pi;
}

static int kmp_find_first_from(const std::string& s, const std::string& pat, size_t start) {
  if (pat.empty()) return -1;
  auto pi = kmp_build(pat);
  size_t j = 0;
  for (size_t i = start; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) return (int)(i + 1 - pat.size());
  }
  return -1;
}

static void kmp_find_all(const std::string& s, const std::string& pat, std::vector<int>& out) {
  out.clear(); if (pat.empty()) return;
  auto pi = kmp_build(pat);
  size_t j = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    while (j > 0 && s[i] != pat[j]) j = pi[j - 1];
    if (s[i] == pat[j]) ++j;
    if (j == pat.size()) { out.push_back((int)(i + 1 - pat.size())); j = pi[j - 1]; }
  }
}

int find_substring(const std::string& s, const std::string& pat, size_t start, bool ignore_case) {
  if (ignore_case) return kmp_find_first_from(fold(s), fold(pat), start);
  return kmp_find_first_from(s, pat, start);
}

void find_all(const std::string& s, const std::string& pat, bool ignore_case, std::vector<int>& out) {
  if (ignore_case) kmp_find_all(fold(s), fold(pat), out);
  else kmp_find_all(s, pat, out);
}

std::optional<SearchHit> search_next(const std::vector<std::string>& lines, Position from,
                                     const std::string& pattern, const SearchOptions& opt) {
  if (pattern.empty() || lines.empty()) return std::nullopt;
  from = clamp_position(lines, from);
  int rows = (int)lines.size();
  {
    const auto& line = lines[from.row];
    int pos = find_substring(line, pattern, (size_t)std::min((int)line.size(), from.col + 1), opt.ignore_case);
    if (pos >= 0) return SearchHit{{from.row, pos}, false};
  }
  for (int r = from.row + 1; r < rows; ++r) {
    int pos = find_substring(lines[r], pattern, 0, opt.ignore_case);
    if (pos >= 0) return SearchHit{{r, pos}, false};
  }
  if (!opt.wrap_scan) return std::nullopt;
  for (int r = 0; r <= from.row; ++r) {
    int pos = find_substring(lines[r], pattern, 0, opt.ignore_case);
    if (pos >= 0) return SearchHit{{r, pos}, true};
  }
  return std::nullopt;
}

std::optional<SearchHit> search_previous(const std::vector<std::string>& lines, Position from,
                                         const std::string& pattern, const SearchOptions& opt) {
  if (pattern.empty() || lines.empty()) return std::nullopt;
  from = clamp_position(lines, from);
  int rows = (int)lines.size();
  std::vector<int> pos;
  {
    find_all(lines[from.row], pattern, opt.ignore_case, pos);
    int target = -1; for (int p : pos) if (p < from.col) target = p;
    if (target >= 0) return SearchHit{{from.row, target}, false};
  }
  for (int r = from.row - 1; r >= 0; --r) {
    find_all(lines[r], pattern, opt.ignore_case, pos);
    if (!pos.empty()) return SearchHit{{r, pos.back()}, false};
  }
  if (!opt.wrap_scan) return std::nullopt;
  for (int r = rows - 1; r >= from.row; --r) {
    find_all(lines[r], pattern, opt.ignore_case, pos);
    if (!pos.empty()) return SearchHit{{r, pos.back()}, true};
  }
  return std::nullopt;
}

std::string word_under_cursor(const std::vector<std::string>& lines, Position p, int* start_col) {
  if (lines.empty()) return std::string();
  p = clamp_position(lines, p);
  const auto& line = lines[p.row];
  int len = (int)line.size();
  int col = p.col;
  while (col < len && is_word_boundary(line[col])) col++;
  if (col >= len) return std::string();
  int st = col;
  while (st > 0 && !is_word_boundary(line[st - 1])) st--;
  int en = col;
  while (en < len && !is_word_boundary(line[en])) en++;
  if (start_col) *start_col = st;
  return line.substr(st, en - st);
}
