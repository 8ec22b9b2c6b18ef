#pragma once
/*
 * Classify
 *
 * Purpose: character classes for word motions and line indentation helpers.
 */
#include <string>

bool is_word_boundary(char c);
inline bool is_word_char(char c) { return !is_word_boundary(c); }

// leading spaces weigh 1, tabs 4; result is floor(total / 4)
int indent_level(const std::string& line);

// column of the first char that is not a space or tab, 0 for blank lines
int first_non_blank(const std::string& line);
