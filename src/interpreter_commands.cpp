#include "interpreter.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include "motion.hpp"
#include "substitute.hpp"

void Interpreter::register_commands() {
  registry_.register_command("w", [this](const std::string& args) {
    if (!args.empty()) return fail(ExStatus::UnrecognizedCommand, "trailing characters: " + args);
    host_.request_save();
    return ExStatus::Ok;
  });
  registry_.register_alias("write", "w");
  registry_.register_command("q", [this](const std::string&) {
    if (doc_.modified()) return fail(ExStatus::UnsavedCloseBlocked, "No write since last change (add ! to override)");
    host_.request_close(false);
    return ExStatus::Ok;
  });
  registry_.register_alias("quit", "q");
  registry_.register_command("q!", [this](const std::string&) {
    host_.request_close(true);
    return ExStatus::Ok;
  });
  registry_.register_alias("quit!", "q!");
  registry_.register_command("wq", [this](const std::string&) {
    host_.request_save();
    host_.request_close(false);
    return ExStatus::Ok;
  });
  registry_.register_alias("x", "wq");
  registry_.register_command("e", [this](const std::string& args) {
    if (args.empty()) return fail(ExStatus::UnrecognizedCommand, "no file name");
    host_.request_load(args);
    return ExStatus::Ok;
  });
  registry_.register_alias("edit", "e");
  registry_.register_command("set", [this](const std::string& args) { return set_options(args); });
  registry_.register_command("s", [this](const std::string& args) { return substitute(args, false); });
  registry_.register_command("%s", [this](const std::string& args) { return substitute(args, true); });
}

ExStatus Interpreter::fail(ExStatus status, const std::string& msg) {
  host_.show_error(msg);
  return status;
}

ExStatus Interpreter::execute_ex(const std::string& line) {
  std::string s = trim(line);
  if (!s.empty() && s[0] == ':') s = trim(s.substr(1));
  if (s.empty()) return ExStatus::Ok;
  if (auto n = parse_line_number(s)) {
    goto_line(*n);
    return ExStatus::Ok;
  }
  ExCommand cmd = split_ex_command(s);
  ExStatus status = ExStatus::Ok;
  if (!registry_.execute(cmd.name, cmd.args, status)) {
    return fail(ExStatus::UnrecognizedCommand, "not an editor command: " + s);
  }
  return status;
}

void Interpreter::goto_line(int line_number) {
  TextState st = load_state();
  jumps_.push(st.cur);
  st.cur = motion_goto_line(st.lines, line_number);
  store_state(st);
}

ExStatus Interpreter::set_options(const std::string& args) {
  std::istringstream iss(args);
  std::vector<std::string> tokens;
  std::string tok;
  while (iss >> tok) tokens.push_back(tok);
  if (tokens.empty()) {
    std::string all;
    for (const auto& name : options_.names()) {
      if (!all.empty()) all += ' ';
      all += (*options_.get(name) ? "" : "no") + name;
    }
    host_.show_message(all);
    return ExStatus::Ok;
  }

  std::vector<OptionRequest> reqs;
  for (const auto& t : tokens) {
    OptionRequest req = parse_option_token(options_, t);
    if (req.name.empty()) return fail(ExStatus::UnknownOption, "unknown option: " + t);
    reqs.push_back(req);
  }

  std::string msg;
  for (const auto& req : reqs) {
    bool value = *options_.get(req.name);
    switch (req.action) {
      case OptionAction::Set: value = true; break;
      case OptionAction::Clear: value = false; break;
      case OptionAction::Toggle: value = !value; break;
      case OptionAction::Query: break;
    }
    if (req.action != OptionAction::Query) {
      options_.set(req.name, value);
      host_.option_changed(req.name, value);
    }
    if (!msg.empty()) msg += ' ';
    msg += req.name + (value ? " on" : " off");
  }
  host_.show_message(msg);
  return ExStatus::Ok;
}

ExStatus Interpreter::substitute(const std::string& cmd, bool whole_document) {
  Substitution sub;
  std::string err;
  if (!parse_substitute(cmd, sub, err)) return fail(ExStatus::InvalidSubstitution, err);
  if (sub.pattern.empty()) sub.pattern = last_search_;
  if (sub.pattern.empty()) return fail(ExStatus::InvalidSubstitution, "no previous pattern");
  boost::regex re;
  if (!compile_substitution(sub, re, err)) return fail(ExStatus::InvalidSubstitution, err);
  last_search_ = sub.pattern;

  TextState st = load_state();
  int first = whole_document ? 0 : st.cur.row;
  int last = whole_document ? static_cast<int>(st.lines.size()) - 1 : st.cur.row;
  int changed_lines = 0, replacements = 0, last_changed = -1;
  for (int r = first; r <= last; ++r) {
    std::string line = st.lines[r];
    int matches = 1;
    if (sub.global) {
      matches = static_cast<int>(std::distance(boost::sregex_iterator(line.begin(), line.end(), re), boost::sregex_iterator()));
    }
    if (!substitute_line(line, re, sub.replacement, sub.global)) continue;
    // `\n` or `\r` in the replacement breaks the line
    std::replace(line.begin(), line.end(), '\r', '\n');
    std::vector<std::string> pieces = split_text(line);
    int added = static_cast<int>(pieces.size()) - 1;
    st.lines[r] = pieces[0];
    st.lines.insert(st.lines.begin() + r + 1, pieces.begin() + 1, pieces.end());
    changed_lines++;
    replacements += matches;
    r += added;
    last += added;
    last_changed = r;
  }
  if (changed_lines == 0) {
    host_.show_message("pattern not found: " + sub.pattern);
    return ExStatus::Ok;
  }
  st.modified = true;
  st.cur = motion_first_non_blank(st.lines, Position{last_changed, 0});
  store_state(st);
  if (whole_document) {
    host_.show_message(std::to_string(replacements) + " substitutions on " + std::to_string(changed_lines) + " lines");
  }
  return ExStatus::Ok;
}
