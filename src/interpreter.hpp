#pragma once
/*
 * Interpreter
 *
 * Purpose: the modal key-event state machine. Each key symbol is routed to the handler
 *          of the current mode, which runs motions/edits/search/macros against the document.
 * Ownership: reads and writes text only through IDocument; asks IHost for I/O, prompts, feedback.
 * Session state: registers, marks, jump list, macros and options outlive mode switches and loads.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "idocument.hpp"
#include "ihost.hpp"
#include "input.hpp"
#include "registers.hpp"
#include "marks.hpp"
#include "macro_recorder.hpp"
#include "options.hpp"
#include "cmd_registry.hpp"
#include "edit.hpp"

class Interpreter {
public:
  Interpreter(IDocument& doc, IHost& host);

  // true when the key was consumed; unconsumed Insert-mode keys belong to the caller
  bool handle_key(const std::string& key);
  ExStatus execute_ex(const std::string& line);

  bool jump_back();
  bool jump_forward();

  Mode mode() const { return mode_; }
  std::string pending_keys() const { return input_.pendingText(); }
  const std::string& command_line() const { return cmdline_; }
  bool visual_active() const;
  Position visual_anchor() const { return anchor_; }
  const std::string& last_search() const { return last_search_; }
  bool last_search_forward() const { return last_forward_; }

  RegisterStore& registers() { return regs_; }
  const MarkStore& marks() const { return marks_; }
  const JumpList& jumps() const { return jumps_; }
  const MacroRecorder& macros() const { return recorder_; }
  const Options& options() const { return options_; }

private:
  enum class Dispatch { Handled, Pending, Unknown };

  struct LastCommand {
    std::vector<std::string> keys;
    int count = 0;
  };

  Dispatch dispatch(const std::string& key);
  Dispatch handle_normal(const std::string& key);
  Dispatch handle_insert(const std::string& key);
  Dispatch handle_visual(const std::string& key);
  Dispatch handle_command_line(const std::string& key);
  Dispatch handle_replace(const std::string& key);

  void execute_normal(const ParsedCommand& pc, int count);
  void repeat_last();
  Position motion_target(const TextState& st, NormalCmd motion, int count) const;
  void apply_operator(TextState& st, NormalCmd op, NormalCmd motion, int count);
  void apply_visual(TextState& st, char op);
  void search(TextState& st, bool forward, int count);
  void play_macro(char reg, int count);

  TextState load_state() const;
  void store_state(const TextState& st);
  void enter_visual(Mode m);
  void exit_visual();

  void register_commands();
  ExStatus fail(ExStatus status, const std::string& msg);
  ExStatus set_options(const std::string& args);
  ExStatus substitute(const std::string& cmd, bool whole_document);
  void goto_line(int line_number);

  IDocument& doc_;
  IHost& host_;

  Mode mode_ = Mode::Normal;
  Input input_;
  std::string cmdline_;
  Position anchor_;
  std::vector<std::optional<char>> replaced_;  // originals overwritten in the current Replace session

  RegisterStore regs_;
  MarkStore marks_;
  JumpList jumps_;
  MacroRecorder recorder_;
  Options options_;
  CommandRegistry registry_;

  std::string last_search_;
  bool last_forward_ = true;
  std::optional<LastCommand> last_command_;
  char last_macro_ = 0;
  int macro_depth_ = 0;
  bool abort_playback_ = false;
};
