#pragma once
/*
 * Search
 *
 * Purpose: literal substring search over document lines (KMP), with wraparound.
 * Rule: forward scans start at cursor.col + 1; backward scans take the last match left of the cursor.
 * Options: ignorecase folds ASCII case; wrapscan off stops at the document edge.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

struct SearchOptions {
  bool ignore_case = false;
  bool wrap_scan = true;
};

struct SearchHit {
  Position pos;
  bool wrapped = false;
};

// -1 when absent
int find_substring(const std::string& s, const std::string& pat, size_t start, bool ignore_case);
void find_all(const std::string& s, const std::string& pat, bool ignore_case, std::vector<int>& out);

std::optional<SearchHit> search_next(const std::vector<std::string>& lines, Position from,
                                     const std::string& pattern, const SearchOptions& opt);
std::optional<SearchHit> search_previous(const std::vector<std::string>& lines, Position from,
                                         const std::string& pattern, const SearchOptions& opt);

// maximal word-char run containing or following the cursor column; empty when none
std::string word_under_cursor(const std::vector<std::string>& lines, Position p, int* start_col = nullptr);
