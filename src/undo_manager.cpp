#include "undo_manager.hpp"

void UndoManager::begin_group(const TextBuffer& buf, const Position& pre) {
  if (!grouping_) {
    grouping_ = true;
    current_.before = buf.lines();
    current_.pre = pre;
  }
}

void UndoManager::commit_group(const TextBuffer& buf, const Position& post) {
  if (grouping_) {
    grouping_ = false;
    if (current_.before != buf.lines()) {
      current_.after = buf.lines();
      current_.post = post;
      undo_entries_.push_back(std::move(current_));
      redo_entries_.clear();
    }
    current_ = UndoEntry{};
  }
}

void UndoManager::clear() {
  undo_entries_.clear();
  redo_entries_.clear();
  grouping_ = false;
  current_ = UndoEntry{};
}

bool UndoManager::can_undo() const { return !undo_entries_.empty(); }
bool UndoManager::can_redo() const { return !redo_entries_.empty(); }

bool UndoManager::undo(TextBuffer& buf, Position& cur) {
  if (undo_entries_.empty()) return false;
  UndoEntry e = std::move(undo_entries_.back());
  undo_entries_.pop_back();
  buf.init_from_lines(e.before);
  cur = e.pre;
  redo_entries_.push_back(std::move(e));
  return true;
}

bool UndoManager::redo(TextBuffer& buf, Position& cur) {
  if (redo_entries_.empty()) return false;
  UndoEntry e = std::move(redo_entries_.back());
  redo_entries_.pop_back();
  buf.init_from_lines(e.after);
  cur = e.post;
  undo_entries_.push_back(std::move(e));
  return true;
}
