#pragma once
/*
 * Edit
 *
 * Purpose: mutating operations over a per-command text snapshot.
 * Rule: every delete/yank captures into the active register before mutating;
 *       whole-line captures end in '\n' and are stored linewise so paste inserts them as new lines.
 * Note: TextState is loaded from the document per command and written back once if modified.
 */
#include <optional>
#include <string>
#include <vector>
#include "registers.hpp"
#include "types.hpp"

struct TextState {
  std::vector<std::string> lines;
  Position cur;
  bool modified = false;
};

std::vector<std::string> split_text(const std::string& text);

// charwise text in [start, end); rows joined by '\n'
std::string text_in_range(const std::vector<std::string>& lines, Position start, Position end);
void erase_range(TextState& st, Position start, Position end);
// returns the position just past the inserted text
Position insert_text(TextState& st, Position at, const std::string& text);

void delete_chars(TextState& st, RegisterStore& regs, int count);
void delete_chars_before(TextState& st, RegisterStore& regs, int count);

void yank_lines(TextState& st, RegisterStore& regs, int row, int count);
void delete_lines(TextState& st, RegisterStore& regs, int row, int count);
// replaces the lines with a single empty line; cursor at its start
void change_lines(TextState& st, RegisterStore& regs, int row, int count);

void yank_range(TextState& st, RegisterStore& regs, Range r, bool linewise);
void delete_range(TextState& st, RegisterStore& regs, Range r, bool linewise);

// rectangle rows [r0, r1] x inclusive columns [c0, c1]
void yank_block(TextState& st, RegisterStore& regs, int r0, int r1, int c0, int c1);
void delete_block(TextState& st, RegisterStore& regs, int r0, int r1, int c0, int c1);

// D/C: remove from cursor to end of line
void delete_to_line_end(TextState& st, RegisterStore& regs);

void paste_after(TextState& st, const std::string& text, bool linewise, int count);
void paste_before(TextState& st, const std::string& text, bool linewise, int count);

void open_line_below(TextState& st);
void open_line_above(TextState& st);

// r{c}: false (no change) when fewer than count chars remain
bool replace_chars(TextState& st, char ch, int count);
// Replace mode: overwrite under cursor or append at line end, then advance.
// Returns the overwritten char, nullopt when appended.
std::optional<char> replace_char_advance(TextState& st, char ch);
// Replace mode Backspace: step left and put back what replace_char_advance returned
void replace_char_undo(TextState& st, std::optional<char> original);
