#include "marks.hpp"
#include "config.hpp"

std::optional<Position> MarkStore::get(char name) const {
  auto it = marks_.find(name);
  if (it == marks_.end()) return std::nullopt;
  return it->second;
}

void JumpList::push(const Position& pos) {
  entries_.push_back(pos);
  trim();
  index_ = entries_.size();
}

std::optional<Position> JumpList::back(const Position& current) {
  if (index_ == 0 || entries_.empty()) return std::nullopt;
  if (index_ == entries_.size()) {
    // leaving the newest end: remember where we were so forward() can return
    entries_.push_back(current);
    trim();
    index_ = entries_.size() - 1;
  }
  --index_;
  return entries_[index_];
}

std::optional<Position> JumpList::forward() {
  if (index_ + 1 >= entries_.size()) return std::nullopt;
  ++index_;
  return entries_[index_];
}

void JumpList::trim() {
  while (entries_.size() > static_cast<size_t>(VK_JUMPLIST_MAX)) {
    entries_.erase(entries_.begin());
    if (index_ > 0) index_--;
  }
}
