#include "ex_command.hpp"
#include <cctype>
#include <charconv>

const char* ex_status_name(ExStatus status) {
  switch (status) {
    case ExStatus::Ok: return "ok";
    case ExStatus::UnrecognizedCommand: return "unrecognized command";
    case ExStatus::InvalidSubstitution: return "invalid substitution";
    case ExStatus::UnsavedCloseBlocked: return "unsaved changes";
    case ExStatus::UnknownOption: return "unknown option";
  }
  return "";
}

std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

ExCommand split_ex_command(const std::string& line) {
  ExCommand cmd;
  std::string s = trim(line);
  if (s.rfind("s/", 0) == 0) { cmd.name = "s"; cmd.args = s; return cmd; }
  if (s.rfind("%s/", 0) == 0) { cmd.name = "%s"; cmd.args = s.substr(1); return cmd; }
  size_t sp = 0;
  while (sp < s.size() && !std::isspace((unsigned char)s[sp])) sp++;
  cmd.name = s.substr(0, sp);
  cmd.args = trim(s.substr(sp));
  return cmd;
}

std::optional<int> parse_line_number(const std::string& s) {
  if (s.empty()) return std::nullopt;
  int value = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), value);
  if (res.ec != std::errc() || res.ptr != s.data() + s.size() || value < 0) return std::nullopt;
  return value;
}
