#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Position/Range).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

enum class Mode { Normal, Insert, Visual, VisualLine, VisualBlock, CommandLine, Replace };

struct Position {
  int row = 0;
  int col = 0;
};

inline bool operator==(const Position& a, const Position& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const Position& a, const Position& b) { return !(a == b); }
inline bool operator<(const Position& a, const Position& b) {
  return a.row < b.row || (a.row == b.row && a.col < b.col);
}
inline bool operator<=(const Position& a, const Position& b) { return !(b < a); }

struct Range {
  Position start;
  Position end;
};

inline Range normalize(Range r) {
  if (r.end < r.start) std::swap(r.start, r.end);
  return r;
}

inline Range normalize(const Position& a, const Position& b) { return normalize(Range{a, b}); }

// Row clamped to [0, lineCount-1], column to [0, lineLength].
inline Position clamp_position(const std::vector<std::string>& lines, Position p) {
  int max_row = std::max(0, static_cast<int>(lines.size()) - 1);
  p.row = std::clamp(p.row, 0, max_row);
  int len = lines.empty() ? 0 : static_cast<int>(lines[p.row].size());
  p.col = std::clamp(p.col, 0, len);
  return p;
}

const char* mode_name(Mode mode);
