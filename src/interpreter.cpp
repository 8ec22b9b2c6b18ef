#include "interpreter.hpp"
#include <algorithm>
#include <cctype>
#include "classify.hpp"
#include "config.hpp"
#include "motion.hpp"
#include "search.hpp"

Interpreter::Interpreter(IDocument& doc, IHost& host) : doc_(doc), host_(host) {
  register_commands();
}

bool Interpreter::handle_key(const std::string& key) {
  // replayed keys are not recorded again
  if (macro_depth_ == 0 && recorder_.recording()) recorder_.record(key);
  return dispatch(key) != Dispatch::Unknown;
}

Interpreter::Dispatch Interpreter::dispatch(const std::string& key) {
  switch (mode_) {
    case Mode::Normal: return handle_normal(key);
    case Mode::Insert: return handle_insert(key);
    case Mode::Visual:
    case Mode::VisualLine:
    case Mode::VisualBlock: return handle_visual(key);
    case Mode::CommandLine: return handle_command_line(key);
    case Mode::Replace: return handle_replace(key);
  }
  return Dispatch::Unknown;
}

bool Interpreter::visual_active() const {
  return mode_ == Mode::Visual || mode_ == Mode::VisualLine || mode_ == Mode::VisualBlock;
}

TextState Interpreter::load_state() const {
  TextState st;
  st.lines = doc_.lines();
  if (st.lines.empty()) st.lines.emplace_back();
  st.cur = clamp_position(st.lines, doc_.cursor());
  return st;
}

void Interpreter::store_state(const TextState& st) {
  if (st.modified) doc_.replace_text(st.lines);
  bool free_col = mode_ == Mode::Insert || mode_ == Mode::Replace;
  doc_.set_cursor(free_col ? clamp_position(st.lines, st.cur) : clamp_normal(st.lines, st.cur));
}

/*----------------------------------------------------------------- Normal */

Interpreter::Dispatch Interpreter::handle_normal(const std::string& key) {
  if (key == "Escape") {
    input_.reset();
    regs_.reset_active();
    return Dispatch::Handled;
  }
  if (input_.consumeDigit(key)) return Dispatch::Pending;
  input_.push(key);
  ParsedCommand pc = parse_normal_command(input_.pending(), recorder_.recording());
  if (pc.status == ParseStatus::Incomplete) return Dispatch::Pending;
  if (pc.status == ParseStatus::Invalid) {
    input_.reset();
    regs_.reset_active();
    return Dispatch::Unknown;
  }
  std::vector<std::string> keys = input_.pending();
  int count = input_.takeCount();
  input_.reset();

  if (pc.cmd == NormalCmd::Repeat) {
    repeat_last();
  } else {
    execute_normal(pc, count);
    last_command_ = LastCommand{keys, count};
  }
  if (pc.cmd != NormalCmd::SelectRegister) regs_.reset_active();
  return Dispatch::Handled;
}

void Interpreter::repeat_last() {
  if (!last_command_) return;
  ParsedCommand pc = parse_normal_command(last_command_->keys, false);
  if (pc.status != ParseStatus::Complete) return;
  execute_normal(pc, last_command_->count);
}

Position Interpreter::motion_target(const TextState& st, NormalCmd motion, int count) const {
  const auto& lines = st.lines;
  int n = std::max(1, count);
  int page = std::max(1, host_.page_lines());
  switch (motion) {
    case NormalCmd::Left: return motion_left(lines, st.cur, n);
    case NormalCmd::Right: return motion_right(lines, st.cur, n);
    case NormalCmd::Up: return motion_up(lines, st.cur, n);
    case NormalCmd::Down: return motion_down(lines, st.cur, n);
    case NormalCmd::WordForward: return motion_word_forward(lines, st.cur, n);
    case NormalCmd::WordBackward: return motion_word_backward(lines, st.cur, n);
    case NormalCmd::WordEnd: return motion_word_end(lines, st.cur, n);
    case NormalCmd::LineStart: return motion_line_start(lines, st.cur);
    case NormalCmd::LineEnd: return motion_line_end(lines, st.cur);
    case NormalCmd::FirstNonBlank: return motion_first_non_blank(lines, st.cur);
    case NormalCmd::GotoLast: return count > 0 ? motion_goto_line(lines, count) : motion_last_line(lines);
    case NormalCmd::GotoFirst: return motion_goto_line(lines, count > 0 ? count : 1);
    case NormalCmd::MatchBracket: return motion_match_bracket(lines, st.cur).value_or(st.cur);
    case NormalCmd::HalfPageDown: return motion_down(lines, st.cur, std::max(1, page / 2));
    case NormalCmd::HalfPageUp: return motion_up(lines, st.cur, std::max(1, page / 2));
    case NormalCmd::PageDown: return motion_down(lines, st.cur, page * std::min(n, static_cast<int>(lines.size())));
    case NormalCmd::PageUp: return motion_up(lines, st.cur, page * std::min(n, static_cast<int>(lines.size())));
    default: return st.cur;
  }
}

static bool is_jump(NormalCmd m) {
  return m == NormalCmd::GotoLast || m == NormalCmd::GotoFirst || m == NormalCmd::MatchBracket;
}

static bool is_visual_motion(NormalCmd m) {
  switch (m) {
    case NormalCmd::Left: case NormalCmd::Right: case NormalCmd::Up: case NormalCmd::Down:
    case NormalCmd::WordForward: case NormalCmd::WordBackward: case NormalCmd::WordEnd:
    case NormalCmd::LineStart: case NormalCmd::LineEnd: case NormalCmd::FirstNonBlank:
    case NormalCmd::GotoLast: case NormalCmd::MatchBracket:
    case NormalCmd::HalfPageDown: case NormalCmd::HalfPageUp: case NormalCmd::PageDown: case NormalCmd::PageUp:
      return true;
    default:
      return false;
  }
}

void Interpreter::execute_normal(const ParsedCommand& pc, int count) {
  int n = std::max(1, count);

  // commands that never touch the text snapshot
  switch (pc.cmd) {
    case NormalCmd::Undo: for (int i = 0; i < n; ++i) doc_.undo(); return;
    case NormalCmd::Redo: for (int i = 0; i < n; ++i) doc_.redo(); return;
    case NormalCmd::SelectRegister: regs_.select(pc.arg); return;
    case NormalCmd::SetMark: marks_.set(pc.arg, doc_.cursor()); return;
    case NormalCmd::RecordMacro:
      recorder_.start(pc.arg);
      host_.show_message(std::string("recording @") + pc.arg);
      return;
    case NormalCmd::StopRecording:
      if (macro_depth_ == 0) recorder_.drop_last();
      host_.show_message(std::string("recorded @") + recorder_.target());
      recorder_.stop();
      return;
    case NormalCmd::PlayMacro: play_macro(pc.arg, n); return;
    case NormalCmd::PlayLastMacro: if (last_macro_) play_macro(last_macro_, n); return;
    case NormalCmd::CommandLine:
      cmdline_.clear();
      mode_ = Mode::CommandLine;
      return;
    default: break;
  }

  TextState st = load_state();
  const std::string& line = st.lines[st.cur.row];
  int len = static_cast<int>(line.size());

  switch (pc.cmd) {
    case NormalCmd::Left: case NormalCmd::Right: case NormalCmd::Up: case NormalCmd::Down:
    case NormalCmd::WordForward: case NormalCmd::WordBackward: case NormalCmd::WordEnd:
    case NormalCmd::LineStart: case NormalCmd::LineEnd: case NormalCmd::FirstNonBlank:
    case NormalCmd::HalfPageDown: case NormalCmd::HalfPageUp: case NormalCmd::PageDown: case NormalCmd::PageUp:
      st.cur = motion_target(st, pc.cmd, count);
      break;
    case NormalCmd::GotoLast: case NormalCmd::GotoFirst: case NormalCmd::MatchBracket: {
      Position target = motion_target(st, pc.cmd, count);
      if (pc.cmd == NormalCmd::MatchBracket && target == st.cur) break;
      jumps_.push(st.cur);
      st.cur = target;
    } break;

    case NormalCmd::Insert: mode_ = Mode::Insert; break;
    case NormalCmd::InsertLineStart: st.cur.col = first_non_blank(line); mode_ = Mode::Insert; break;
    case NormalCmd::Append: st.cur.col = std::min(st.cur.col + 1, len); mode_ = Mode::Insert; break;
    case NormalCmd::AppendLineEnd: st.cur.col = len; mode_ = Mode::Insert; break;
    case NormalCmd::OpenBelow: open_line_below(st); mode_ = Mode::Insert; break;
    case NormalCmd::OpenAbove: open_line_above(st); mode_ = Mode::Insert; break;
    case NormalCmd::Visual: enter_visual(Mode::Visual); anchor_ = st.cur; break;
    case NormalCmd::VisualLine: enter_visual(Mode::VisualLine); anchor_ = st.cur; break;
    case NormalCmd::VisualBlock: enter_visual(Mode::VisualBlock); anchor_ = st.cur; break;
    case NormalCmd::ReplaceMode: mode_ = Mode::Replace; replaced_.clear(); break;

    case NormalCmd::DeleteChar: delete_chars(st, regs_, n); break;
    case NormalCmd::DeleteCharBefore: delete_chars_before(st, regs_, n); break;
    case NormalCmd::DeleteLine: delete_lines(st, regs_, st.cur.row, n); break;
    case NormalCmd::DeleteToEnd: delete_to_line_end(st, regs_); break;
    case NormalCmd::ChangeLine: change_lines(st, regs_, st.cur.row, n); mode_ = Mode::Insert; break;
    case NormalCmd::ChangeToEnd:
      delete_to_line_end(st, regs_);
      mode_ = Mode::Insert;
      break;
    case NormalCmd::YankLine: yank_lines(st, regs_, st.cur.row, n); break;
    case NormalCmd::DeleteMotion: apply_operator(st, NormalCmd::DeleteMotion, pc.motion, count); break;
    case NormalCmd::ChangeMotion: apply_operator(st, NormalCmd::ChangeMotion, pc.motion, count); break;
    case NormalCmd::YankMotion: apply_operator(st, NormalCmd::YankMotion, pc.motion, count); break;
    case NormalCmd::PasteAfter: paste_after(st, regs_.get_active(), regs_.active_linewise(), n); break;
    case NormalCmd::PasteBefore: paste_before(st, regs_.get_active(), regs_.active_linewise(), n); break;
    case NormalCmd::ReplaceChar: replace_chars(st, pc.arg, n); break;

    case NormalCmd::SearchForward:
    case NormalCmd::SearchBackward: {
      bool forward = pc.cmd == NormalCmd::SearchForward;
      auto pat = host_.prompt(forward ? "/" : "?");
      if (!pat) break;
      if (!pat->empty()) last_search_ = *pat;
      last_forward_ = forward;
      search(st, forward, n);
    } break;
    case NormalCmd::SearchNext: search(st, last_forward_, n); break;
    case NormalCmd::SearchPrev: search(st, !last_forward_, n); break;
    case NormalCmd::SearchWordForward:
    case NormalCmd::SearchWordBackward: {
      int start = 0;
      std::string word = word_under_cursor(st.lines, st.cur, &start);
      if (word.empty()) break;
      last_search_ = word;
      last_forward_ = pc.cmd == NormalCmd::SearchWordForward;
      // a backward search starts from the word itself so it skips the word under the cursor
      if (!last_forward_) st.cur.col = start;
      Position before = doc_.cursor();
      search(st, last_forward_, n);
      if (!last_forward_ && st.cur.row == before.row && st.cur.col == start) st.cur = before;
    } break;

    case NormalCmd::JumpMarkLine:
    case NormalCmd::JumpMarkExact: {
      auto m = marks_.get(pc.arg);
      if (!m) break;
      jumps_.push(st.cur);
      if (pc.cmd == NormalCmd::JumpMarkLine) st.cur = motion_first_non_blank(st.lines, Position{m->row, 0});
      else st.cur = clamp_normal(st.lines, *m);
    } break;
    default: break;
  }
  store_state(st);
}

void Interpreter::apply_operator(TextState& st, NormalCmd op, NormalCmd motion, int count) {
  Position start = st.cur;
  const std::string& line = st.lines[start.row];
  int len = static_cast<int>(line.size());
  bool on_word = start.col < len && !std::isspace(static_cast<unsigned char>(line[start.col]));
  if (op == NormalCmd::ChangeMotion && motion == NormalCmd::WordForward && on_word) motion = NormalCmd::WordEnd;

  Position target = motion_target(st, motion, count);
  if (is_jump(motion)) jumps_.push(st.cur);

  if (is_linewise_motion(motion)) {
    int r0 = std::min(start.row, target.row);
    int r1 = std::max(start.row, target.row);
    if (op == NormalCmd::DeleteMotion) delete_lines(st, regs_, r0, r1 - r0 + 1);
    else if (op == NormalCmd::YankMotion) { yank_lines(st, regs_, r0, r1 - r0 + 1); st.cur.row = r0; }
    else { change_lines(st, regs_, r0, r1 - r0 + 1); mode_ = Mode::Insert; }
    return;
  }

  Position end = target;
  if (motion == NormalCmd::Right) {
    end = Position{start.row, std::min(len, start.col + std::max(1, count))};
  } else if (motion == NormalCmd::LineEnd) {
    end = Position{start.row, len};
  } else if (is_inclusive_motion(motion)) {
    end.col = std::min(end.col + 1, static_cast<int>(st.lines[end.row].size()));
  } else if (motion == NormalCmd::WordForward) {
    const std::string& tl = st.lines[target.row];
    bool word_start = target.col > 0 && target.col < static_cast<int>(tl.size()) &&
                      !is_word_boundary(tl[target.col]) && is_word_boundary(tl[target.col - 1]);
    if (target.row > start.row && target.col == 0) {
      // an exclusive span ending at column 0 stops at the end of the previous line
      end = Position{target.row - 1, static_cast<int>(st.lines[target.row - 1].size())};
    } else if (target.row == start.row && (!word_start || !(start < target))) {
      end = Position{start.row, len};
    }
  }

  Range r = normalize(start, end);
  if (op == NormalCmd::YankMotion) {
    yank_range(st, regs_, r, false);
    st.cur = r.start;
    return;
  }
  delete_range(st, regs_, r, false);
  st.cur = r.start;
  if (op == NormalCmd::ChangeMotion) mode_ = Mode::Insert;
}

void Interpreter::search(TextState& st, bool forward, int count) {
  if (last_search_.empty()) { host_.show_message("no previous pattern"); return; }
  SearchOptions opt;
  opt.ignore_case = options_.ignorecase();
  opt.wrap_scan = options_.wrapscan();
  Position p = st.cur;
  bool found = false, wrapped = false;
  for (int i = 0; i < std::max(1, count); ++i) {
    auto hit = forward ? search_next(st.lines, p, last_search_, opt) : search_previous(st.lines, p, last_search_, opt);
    if (!hit) break;
    p = hit->pos;
    wrapped = wrapped || hit->wrapped;
    found = true;
  }
  if (!found) {
    if (!opt.wrap_scan) host_.show_message(std::string(forward ? "search hit BOTTOM" : "search hit TOP") + " without match for: " + last_search_);
    else host_.show_message("pattern not found: " + last_search_);
    return;
  }
  jumps_.push(st.cur);
  st.cur = p;
  if (wrapped) host_.show_message(forward ? "search hit BOTTOM, continuing at TOP" : "search hit TOP, continuing at BOTTOM");
}

void Interpreter::play_macro(char reg, int count) {
  const auto* stored = recorder_.find(reg);
  if (!stored) return;
  if (macro_depth_ >= VK_MACRO_MAX_DEPTH) {
    host_.show_error(std::string("macro @") + reg + ": recursion deeper than " + std::to_string(VK_MACRO_MAX_DEPTH));
    abort_playback_ = true;
    return;
  }
  last_macro_ = reg;
  std::vector<std::string> keys = *stored;
  ++macro_depth_;
  for (int i = 0; i < std::max(1, count) && !abort_playback_; ++i) {
    for (const auto& k : keys) {
      if (abort_playback_) break;
      if (!handle_key(k) && mode_ == Mode::Insert) host_.forward_key(k);
    }
  }
  --macro_depth_;
  if (macro_depth_ == 0) abort_playback_ = false;
}

/*----------------------------------------------------------------- Insert / Replace */

Interpreter::Dispatch Interpreter::handle_insert(const std::string& key) {
  if (key != "Escape") return Dispatch::Unknown;
  mode_ = Mode::Normal;
  input_.reset();
  Position p = doc_.cursor();
  p.col = std::max(0, p.col - 1);
  TextState st = load_state();
  doc_.set_cursor(clamp_normal(st.lines, p));
  return Dispatch::Handled;
}

Interpreter::Dispatch Interpreter::handle_replace(const std::string& key) {
  if (key == "Escape") return handle_insert(key);
  TextState st = load_state();
  if (key == "Backspace") {
    // only chars replaced in this session are restored; before that it just moves left
    if (replaced_.empty()) {
      st.cur.col = std::max(0, st.cur.col - 1);
    } else {
      replace_char_undo(st, replaced_.back());
      replaced_.pop_back();
    }
  } else if (key == "Space" || (key.size() == 1 && static_cast<unsigned char>(key[0]) >= 32)) {
    replaced_.push_back(replace_char_advance(st, key == "Space" ? ' ' : key[0]));
  } else {
    return Dispatch::Unknown;
  }
  store_state(st);
  return Dispatch::Handled;
}

/*----------------------------------------------------------------- Visual */

void Interpreter::enter_visual(Mode m) {
  mode_ = m;
}

void Interpreter::exit_visual() {
  mode_ = Mode::Normal;
  input_.reset();
}

Interpreter::Dispatch Interpreter::handle_visual(const std::string& key) {
  if (key == "Escape") { exit_visual(); return Dispatch::Handled; }
  if (input_.pending().empty() && input_.consumeDigit(key)) return Dispatch::Pending;

  if (!input_.pending().empty()) {
    // only "gg" is a two-key sequence here
    bool gg = input_.pending().size() == 1 && input_.pending()[0] == "g" && key == "g";
    int count = input_.takeCount();
    input_.reset();
    if (!gg) return Dispatch::Unknown;
    TextState st = load_state();
    st.cur = motion_target(st, NormalCmd::GotoFirst, count);
    store_state(st);
    return Dispatch::Handled;
  }
  if (key == "g") { input_.push(key); return Dispatch::Pending; }

  Mode target = key == "v" ? Mode::Visual : key == "V" ? Mode::VisualLine : key == "Ctrl+v" ? Mode::VisualBlock : Mode::Normal;
  if (target != Mode::Normal) {
    if (target == mode_) exit_visual();
    else mode_ = target;
    return Dispatch::Handled;
  }
  if (key == "o") {
    Position cur = doc_.cursor();
    doc_.set_cursor(anchor_);
    anchor_ = cur;
    return Dispatch::Handled;
  }
  if (key == ":") {
    exit_visual();
    cmdline_.clear();
    mode_ = Mode::CommandLine;
    return Dispatch::Handled;
  }

  TextState st = load_state();
  int count = input_.takeCount();
  if (key == "d" || key == "x" || key == "Delete" || key == "y" || key == "c") {
    apply_visual(st, key == "y" ? 'y' : key == "c" ? 'c' : 'd');
    store_state(st);
    regs_.reset_active();
    return Dispatch::Handled;
  }
  ParsedCommand pc = parse_normal_command({key}, false);
  bool motion = pc.status == ParseStatus::Complete && is_visual_motion(pc.cmd);
  if (!motion) return Dispatch::Unknown;
  st.cur = motion_target(st, pc.cmd, count);
  store_state(st);
  return Dispatch::Handled;
}

void Interpreter::apply_visual(TextState& st, char op) {
  Mode m = mode_;
  Range r = normalize(anchor_, st.cur);
  exit_visual();
  if (m == Mode::VisualLine) {
    int rows = r.end.row - r.start.row + 1;
    if (op == 'y') { yank_lines(st, regs_, r.start.row, rows); st.cur = Position{r.start.row, 0}; }
    else if (op == 'd') delete_lines(st, regs_, r.start.row, rows);
    else { change_lines(st, regs_, r.start.row, rows); mode_ = Mode::Insert; }
    return;
  }
  if (m == Mode::VisualBlock) {
    int c0 = std::min(anchor_.col, st.cur.col);
    int c1 = std::max(anchor_.col, st.cur.col);
    if (op == 'y') { yank_block(st, regs_, r.start.row, r.end.row, c0, c1); st.cur = Position{r.start.row, c0}; }
    else {
      delete_block(st, regs_, r.start.row, r.end.row, c0, c1);
      if (op == 'c') { st.cur = Position{r.start.row, c0}; mode_ = Mode::Insert; }
    }
    return;
  }
  Position end = r.end;
  end.col = std::min(end.col + 1, static_cast<int>(st.lines[end.row].size()));
  if (op == 'y') { yank_range(st, regs_, Range{r.start, end}, false); st.cur = r.start; return; }
  delete_range(st, regs_, Range{r.start, end}, false);
  st.cur = r.start;
  if (op == 'c') mode_ = Mode::Insert;
}

/*----------------------------------------------------------------- CommandLine */

Interpreter::Dispatch Interpreter::handle_command_line(const std::string& key) {
  if (key == "Escape") {
    cmdline_.clear();
    mode_ = Mode::Normal;
    return Dispatch::Handled;
  }
  if (key == "Enter") {
    std::string line = cmdline_;
    cmdline_.clear();
    mode_ = Mode::Normal;
    execute_ex(line);
    return Dispatch::Handled;
  }
  if (key == "Backspace") {
    if (cmdline_.empty()) mode_ = Mode::Normal;
    else cmdline_.pop_back();
    return Dispatch::Handled;
  }
  if (key == "Space") { cmdline_ += ' '; return Dispatch::Handled; }
  if (key == "Tab") { cmdline_ += '\t'; return Dispatch::Handled; }
  if (key.size() == 1) { cmdline_ += key; return Dispatch::Handled; }
  return Dispatch::Unknown;
}

/*----------------------------------------------------------------- Jump list */

bool Interpreter::jump_back() {
  auto p = jumps_.back(doc_.cursor());
  if (!p) return false;
  TextState st = load_state();
  doc_.set_cursor(clamp_normal(st.lines, *p));
  return true;
}

bool Interpreter::jump_forward() {
  auto p = jumps_.forward();
  if (!p) return false;
  TextState st = load_state();
  doc_.set_cursor(clamp_normal(st.lines, *p));
  return true;
}
