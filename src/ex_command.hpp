#pragma once
/*
 * ExCommand
 *
 * Purpose: command-line parsing helpers and the status every ex command reports.
 */
#include <optional>
#include <string>

enum class ExStatus { Ok, UnrecognizedCommand, InvalidSubstitution, UnsavedCloseBlocked, UnknownOption };

const char* ex_status_name(ExStatus status);

struct ExCommand {
  std::string name;
  std::string args;
};

std::string trim(const std::string& s);

// "s/.." and "%s/.." keep the whole substitution in args; otherwise name is the first word
ExCommand split_ex_command(const std::string& line);

// a bare positive or zero integer, nothing else
std::optional<int> parse_line_number(const std::string& s);
