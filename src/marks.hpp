#pragma once
/*
 * MarkStore / JumpList
 *
 * Purpose: named cursor bookmarks and the back/forward history of jump motions.
 * Note: jump list index runs in [0, size]; size means "past the newest entry".
 */
#include <optional>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class MarkStore {
public:
  void set(char name, const Position& pos) { marks_[name] = pos; }
  std::optional<Position> get(char name) const;
  void clear() { marks_.clear(); }
  size_t size() const { return marks_.size(); }

private:
  std::unordered_map<char, Position> marks_;
};

class JumpList {
public:
  void push(const Position& pos);
  std::optional<Position> back(const Position& current);
  std::optional<Position> forward();

  size_t size() const { return entries_.size(); }
  size_t index() const { return index_; }
  const std::vector<Position>& entries() const { return entries_; }

private:
  void trim();
  std::vector<Position> entries_;
  size_t index_ = 0;
};
