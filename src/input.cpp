#include "input.hpp"
#include <algorithm>

static constexpr int kMaxCount = 99999999;

static bool is_operator_key(const std::string& k) { return k == "d" || k == "c" || k == "y"; }

bool Input::consumeDigit(const std::string& key) {
  if (key.size() != 1) return false;
  char ch = key[0];
  int* target = nullptr;
  if (pending_.empty()) target = &pending_count_;
  else if (pending_.size() == 1 && is_operator_key(pending_[0])) target = &motion_count_;
  if (!target) return false;
  if (ch == '0' && *target == 0) return false;
  if (ch < '0' || ch > '9') return false;
  // saturate; extra digits are still consumed
  if (*target > (kMaxCount - (ch - '0')) / 10) *target = kMaxCount;
  else *target = *target * 10 + (ch - '0');
  return true;
}

std::string Input::pendingText() const {
  std::string out;
  if (pending_count_ > 0) out += std::to_string(pending_count_);
  if (!pending_.empty()) out += pending_[0];
  if (motion_count_ > 0) out += std::to_string(motion_count_);
  for (size_t i = 1; i < pending_.size(); ++i) out += pending_[i];
  return out;
}

bool Input::hasCount() const {
  return pending_count_ > 0 || motion_count_ > 0;
}

int Input::takeCount() {
  int c = 0;
  if (hasCount()) {
    long long total = static_cast<long long>(std::max(1, pending_count_)) * std::max(1, motion_count_);
    c = static_cast<int>(std::min<long long>(total, kMaxCount));
  }
  pending_count_ = 0;
  motion_count_ = 0;
  return c;
}

void Input::reset() {
  pending_.clear();
  pending_count_ = 0;
  motion_count_ = 0;
}

static NormalCmd motion_for(const std::string& k) {
  if (k == "h" || k == "Left") return NormalCmd::Left;
  if (k == "l" || k == "Right") return NormalCmd::Right;
  if (k == "j" || k == "Down") return NormalCmd::Down;
  if (k == "k" || k == "Up") return NormalCmd::Up;
  if (k == "w") return NormalCmd::WordForward;
  if (k == "b") return NormalCmd::WordBackward;
  if (k == "e") return NormalCmd::WordEnd;
  if (k == "0" || k == "Home") return NormalCmd::LineStart;
  if (k == "$" || k == "End") return NormalCmd::LineEnd;
  if (k == "^") return NormalCmd::FirstNonBlank;
  if (k == "G") return NormalCmd::GotoLast;
  return NormalCmd::None;
}

static NormalCmd single_key_command(const std::string& k) {
  NormalCmd m = motion_for(k);
  if (m != NormalCmd::None) return m;
  if (k == "%") return NormalCmd::MatchBracket;
  if (k == "Ctrl+d") return NormalCmd::HalfPageDown;
  if (k == "Ctrl+u") return NormalCmd::HalfPageUp;
  if (k == "Ctrl+f" || k == "PageDown") return NormalCmd::PageDown;
  if (k == "Ctrl+b" || k == "PageUp") return NormalCmd::PageUp;
  if (k == "i" || k == "Insert") return NormalCmd::Insert;
  if (k == "I") return NormalCmd::InsertLineStart;
  if (k == "a") return NormalCmd::Append;
  if (k == "A") return NormalCmd::AppendLineEnd;
  if (k == "o") return NormalCmd::OpenBelow;
  if (k == "O") return NormalCmd::OpenAbove;
  if (k == "v") return NormalCmd::Visual;
  if (k == "V") return NormalCmd::VisualLine;
  if (k == "Ctrl+v") return NormalCmd::VisualBlock;
  if (k == "R") return NormalCmd::ReplaceMode;
  if (k == ":") return NormalCmd::CommandLine;
  if (k == "x" || k == "Delete") return NormalCmd::DeleteChar;
  if (k == "X") return NormalCmd::DeleteCharBefore;
  if (k == "D") return NormalCmd::DeleteToEnd;
  if (k == "C") return NormalCmd::ChangeToEnd;
  if (k == "Y") return NormalCmd::YankLine;
  if (k == "p") return NormalCmd::PasteAfter;
  if (k == "P") return NormalCmd::PasteBefore;
  if (k == "u") return NormalCmd::Undo;
  if (k == "Ctrl+r") return NormalCmd::Redo;
  if (k == ".") return NormalCmd::Repeat;
  if (k == "/") return NormalCmd::SearchForward;
  if (k == "?") return NormalCmd::SearchBackward;
  if (k == "n") return NormalCmd::SearchNext;
  if (k == "N") return NormalCmd::SearchPrev;
  if (k == "*") return NormalCmd::SearchWordForward;
  if (k == "#") return NormalCmd::SearchWordBackward;
  return NormalCmd::None;
}

ParsedCommand parse_normal_command(const std::vector<std::string>& keys, bool recording) {
  ParsedCommand pc;
  if (keys.empty()) return pc;
  auto complete = [&pc](NormalCmd c) { pc.status = ParseStatus::Complete; pc.cmd = c; return pc; };
  auto incomplete = [&pc]() { pc.status = ParseStatus::Incomplete; return pc; };
  const std::string& k0 = keys[0];

  if (is_operator_key(k0)) {
    NormalCmd line_cmd = k0 == "d" ? NormalCmd::DeleteLine : k0 == "c" ? NormalCmd::ChangeLine : NormalCmd::YankLine;
    NormalCmd op_cmd = k0 == "d" ? NormalCmd::DeleteMotion : k0 == "c" ? NormalCmd::ChangeMotion : NormalCmd::YankMotion;
    if (keys.size() == 1) return incomplete();
    const std::string& k1 = keys[1];
    if (keys.size() == 2 && k1 == k0) return complete(line_cmd);
    if (k1 == "g") {
      if (keys.size() == 2) return incomplete();
      if (keys.size() == 3 && keys[2] == "g") { pc.motion = NormalCmd::GotoFirst; return complete(op_cmd); }
      return pc;
    }
    NormalCmd m = motion_for(k1);
    if (keys.size() == 2 && m != NormalCmd::None) { pc.motion = m; return complete(op_cmd); }
    return pc;
  }

  if (k0 == "g") {
    if (keys.size() == 1) return incomplete();
    if (keys.size() == 2 && keys[1] == "g") return complete(NormalCmd::GotoFirst);
    return pc;
  }

  if (k0 == "q" && recording) {
    if (keys.size() == 1) return complete(NormalCmd::StopRecording);
    return pc;
  }

  NormalCmd with_arg = NormalCmd::None;
  if (k0 == "r") with_arg = NormalCmd::ReplaceChar;
  else if (k0 == "m") with_arg = NormalCmd::SetMark;
  else if (k0 == "'") with_arg = NormalCmd::JumpMarkLine;
  else if (k0 == "`") with_arg = NormalCmd::JumpMarkExact;
  else if (k0 == "q") with_arg = NormalCmd::RecordMacro;
  else if (k0 == "@") with_arg = NormalCmd::PlayMacro;
  else if (k0 == "\"") with_arg = NormalCmd::SelectRegister;
  if (with_arg != NormalCmd::None) {
    if (keys.size() == 1) return incomplete();
    if (keys.size() != 2 || keys[1].size() != 1) return pc;
    pc.arg = keys[1][0];
    if (with_arg == NormalCmd::PlayMacro && pc.arg == '@') return complete(NormalCmd::PlayLastMacro);
    return complete(with_arg);
  }

  if (keys.size() != 1) return pc;
  NormalCmd c = single_key_command(k0);
  if (c == NormalCmd::None) return pc;
  return complete(c);
}

bool is_linewise_motion(NormalCmd m) {
  return m == NormalCmd::Up || m == NormalCmd::Down || m == NormalCmd::GotoLast || m == NormalCmd::GotoFirst;
}

bool is_inclusive_motion(NormalCmd m) {
  return m == NormalCmd::WordEnd || m == NormalCmd::LineEnd;
}
