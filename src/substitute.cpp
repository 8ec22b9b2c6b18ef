#include "substitute.hpp"
#include <cctype>
#include <vector>

/*split on unescaped '/', keeping every escape except "\/" for the regex engine*/
static std::vector<std::string> split_fields(const std::string& body) {
  std::vector<std::string> parts(1);
  for (size_t i = 0; i < body.size(); ++i) {
    char c = body[i];
    if (c == '\\' && i + 1 < body.size()) {
      if (body[i + 1] == '/' && parts.size() < 3) parts.back() += '/';
      else { parts.back() += c; parts.back() += body[i + 1]; }
      ++i;
      continue;
    }
    if (c == '/' && parts.size() < 3) { parts.emplace_back(); continue; }
    parts.back() += c;
  }
  return parts;
}

static std::string to_perl_format(const std::string& repl) {
  std::string out;
  for (size_t i = 0; i < repl.size(); ++i) {
    if (repl[i] == '\\' && i + 1 < repl.size() && std::isdigit(static_cast<unsigned char>(repl[i + 1]))) {
      out += "${";
      out += repl[i + 1];
      out += '}';
      ++i;
      continue;
    }
    out += repl[i];
  }
  return out;
}

bool parse_substitute(const std::string& cmd, Substitution& out, std::string& err) {
  if (cmd.rfind("s/", 0) != 0) { err = "invalid substitute command"; return false; }
  auto parts = split_fields(cmd.substr(2));
  if (parts.size() < 2) { err = "invalid substitute command: missing '/'"; return false; }
  Substitution sub;
  sub.pattern = parts[0];
  sub.replacement = to_perl_format(parts[1]);
  if (parts.size() == 3) {
    for (char f : parts[2]) {
      if (f == 'g') sub.global = true;
      else if (f == 'i') sub.ignore_case = true;
      else { err = std::string("invalid substitute flag: ") + f; return false; }
    }
  }
  out = sub;
  return true;
}

bool compile_substitution(const Substitution& sub, boost::regex& re, std::string& err) {
  try {
    boost::regex::flag_type flags = boost::regex::perl;
    if (sub.ignore_case) flags |= boost::regex::icase;
    re.assign(sub.pattern, flags);
  } catch (const boost::regex_error& e) {
    err = std::string("invalid pattern: ") + e.what();
    return false;
  }
  return true;
}

bool substitute_line(std::string& line, const boost::regex& re, const std::string& replacement, bool global) {
  if (!boost::regex_search(line, re)) return false;
  boost::match_flag_type flags = boost::match_default | boost::format_perl;
  if (!global) flags |= boost::format_first_only;
  line = boost::regex_replace(line, re, replacement, flags);
  return true;
}
