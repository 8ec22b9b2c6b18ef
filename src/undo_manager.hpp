#pragma once
#include <vector>
#include <string>
#include "types.hpp"
#include "text_buffer.hpp"

/*
 * UndoManager
 *
 * Purpose: grouped undo/redo over whole-text snapshots.
 * Rule: a group records the text and cursor at begin and at commit; unchanged groups are dropped.
 */

struct UndoEntry {
  std::vector<std::string> before;
  std::vector<std::string> after;
  Position pre;
  Position post;
};

class UndoManager {
public:
  void begin_group(const TextBuffer& buf, const Position& pre);
  void commit_group(const TextBuffer& buf, const Position& post);
  bool grouping() const { return grouping_; }
  void clear();
  bool can_undo() const;
  bool can_redo() const;
  bool undo(TextBuffer& buf, Position& cur);
  bool redo(TextBuffer& buf, Position& cur);

private:
  std::vector<UndoEntry> undo_entries_;
  std::vector<UndoEntry> redo_entries_;
  bool grouping_ = false;
  UndoEntry current_;
};
