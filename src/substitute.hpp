#pragma once
/*
 * Substitute
 *
 * Purpose: parse `s/pattern/replacement/flags` and apply it per line with Boost.Regex.
 * Syntax: `\/` is a literal slash in either field; `\1`..`\9` in the replacement become `${N}`;
 *         other escapes reach the regex engine untouched. Flags: g (every match), i (icase).
 */
#include <string>
#include <boost/regex.hpp>

struct Substitution {
  std::string pattern;
  std::string replacement;  // Perl format string
  bool global = false;
  bool ignore_case = false;
};

// cmd must start with "s/"; false + err on malformed input
bool parse_substitute(const std::string& cmd, Substitution& out, std::string& err);

// false + err when the pattern does not compile
bool compile_substitution(const Substitution& sub, boost::regex& re, std::string& err);

// true when at least one match was replaced
bool substitute_line(std::string& line, const boost::regex& re, const std::string& replacement, bool global);
