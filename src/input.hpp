#pragma once
#include <string>
#include <vector>
/*
 * Input
 *
 * Purpose: Normal mode pending keys and count prefixes, and the command table that
 *          resolves a pending key sequence into a NormalCmd.
 * Rule: prefixes (d c y r m ' ` q @ " g) are Incomplete until their second key arrives;
 *       an operator followed by a non-motion is Invalid.
 */

enum class NormalCmd {
  None,
  // motions
  Left, Right, Up, Down,
  WordForward, WordBackward, WordEnd,
  LineStart, LineEnd, FirstNonBlank,
  GotoLast, GotoFirst, MatchBracket,
  HalfPageDown, HalfPageUp, PageDown, PageUp,
  // mode switches
  Insert, InsertLineStart, Append, AppendLineEnd, OpenBelow, OpenAbove,
  Visual, VisualLine, VisualBlock, ReplaceMode, CommandLine,
  // edits
  DeleteChar, DeleteCharBefore, DeleteLine, DeleteToEnd, DeleteMotion,
  ChangeLine, ChangeToEnd, ChangeMotion,
  YankLine, YankMotion,
  PasteAfter, PasteBefore, ReplaceChar,
  Undo, Redo, Repeat,
  // search
  SearchForward, SearchBackward, SearchNext, SearchPrev, SearchWordForward, SearchWordBackward,
  // marks, macros, registers
  SetMark, JumpMarkLine, JumpMarkExact,
  RecordMacro, StopRecording, PlayMacro, PlayLastMacro,
  SelectRegister,
};

enum class ParseStatus { Complete, Incomplete, Invalid };

struct ParsedCommand {
  ParseStatus status = ParseStatus::Invalid;
  NormalCmd cmd = NormalCmd::None;
  NormalCmd motion = NormalCmd::None;  // target of an operator
  char arg = 0;                        // r/m/'/`/q/@/" argument
};

ParsedCommand parse_normal_command(const std::vector<std::string>& keys, bool recording);

// motions allowed after d/c/y; linewise ones act on whole rows
bool is_linewise_motion(NormalCmd m);
// true for e and $, whose target column is part of the span
bool is_inclusive_motion(NormalCmd m);

class Input {
public:
  // digits before a command (or between operator and motion) build the count
  bool consumeDigit(const std::string& key);
  void push(const std::string& key) { pending_.push_back(key); }
  const std::vector<std::string>& pending() const { return pending_; }
  std::string pendingText() const;
  bool hasCount() const;
  // 0 when no count was typed; counts around an operator multiply
  int takeCount();
  void reset();
private:
  std::vector<std::string> pending_;
  int pending_count_ = 0;
  int motion_count_ = 0;
};
