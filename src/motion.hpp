#pragma once
/*
 * Motion
 *
 * Purpose: pure cursor motions over a line array; no buffer mutation.
 * Rule: results are clamped to Normal-mode columns [0, max(len-1, 0)].
 * Count: simple motions are applied `count` times; line targets are 1-based and clamped.
 */
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

using Lines = std::vector<std::string>;

int line_length(const Lines& lines, int row);
int max_normal_col(const Lines& lines, int row);
Position clamp_normal(const Lines& lines, Position p);

Position motion_left(const Lines& lines, Position p, int count);
Position motion_right(const Lines& lines, Position p, int count);
Position motion_up(const Lines& lines, Position p, int count);
Position motion_down(const Lines& lines, Position p, int count);

Position motion_word_forward(const Lines& lines, Position p, int count);
Position motion_word_backward(const Lines& lines, Position p, int count);
Position motion_word_end(const Lines& lines, Position p, int count);

Position motion_line_start(const Lines& lines, Position p);
Position motion_line_end(const Lines& lines, Position p);
Position motion_first_non_blank(const Lines& lines, Position p);

Position motion_goto_line(const Lines& lines, int line_number);
Position motion_last_line(const Lines& lines);

// nullopt when no bracket is at/after the cursor on its line or it is unbalanced
std::optional<Position> motion_match_bracket(const Lines& lines, Position p);
