#include <cassert>
#include <string>
#include <vector>
#include "classify.hpp"
#include "ex_command.hpp"
#include "input.hpp"
#include "options.hpp"
#include "types.hpp"

static void test_positions() {
  Range r = normalize(Position{2, 1}, Position{0, 3});
  assert(r.start == (Position{0, 3}));
  assert(r.end == (Position{2, 1}));
  assert((Position{1, 5}) < (Position{2, 0}));
  assert((Position{1, 5}) <= (Position{1, 5}));

  std::vector<std::string> lines = {"abc", "de"};
  assert(clamp_position(lines, Position{5, 9}) == (Position{1, 2}));
  assert(clamp_position(lines, Position{-1, -4}) == (Position{0, 0}));
  assert(std::string(mode_name(Mode::VisualLine)) == "V-LINE");
  assert(std::string(mode_name(Mode::Replace)) == "REPLACE");
}

static void test_classify() {
  assert(is_word_boundary(' '));
  assert(is_word_boundary('.'));
  assert(is_word_boundary('}'));
  assert(!is_word_boundary('a'));
  assert(!is_word_boundary('_'));
  assert(is_word_char('7'));

  assert(indent_level("        x") == 2);
  assert(indent_level("\tx") == 1);
  assert(indent_level("   x") == 0);
  assert(indent_level(" \tx") == 1);
  assert(first_non_blank("  ab") == 2);
  assert(first_non_blank("   ") == 0);
}

static void test_options() {
  Options o;
  assert(!*o.get("nu"));
  assert(*o.get("wrap"));
  assert(*o.get("ws"));
  assert(!o.get("hlsearch"));
  assert(o.canonical("ic") == "ignorecase");

  OptionRequest r = parse_option_token(o, "nonu");
  assert(r.name == "number" && r.action == OptionAction::Clear);
  r = parse_option_token(o, "invwrap");
  assert(r.name == "wrap" && r.action == OptionAction::Toggle);
  r = parse_option_token(o, "ws?");
  assert(r.name == "wrapscan" && r.action == OptionAction::Query);
  r = parse_option_token(o, "rnu!");
  assert(r.name == "relativenumber" && r.action == OptionAction::Toggle);
  r = parse_option_token(o, "nowrapscan");
  assert(r.name == "wrapscan" && r.action == OptionAction::Clear);
  r = parse_option_token(o, "nonumber?");
  assert(r.name == "number" && r.action == OptionAction::Query);
  r = parse_option_token(o, "nowrap!");
  assert(r.name == "wrap" && r.action == OptionAction::Toggle);
  r = parse_option_token(o, "invalid");
  assert(r.name.empty());

  assert(o.set("ic", true));
  assert(o.ignorecase());
  assert(!o.set("bogus", true));
}

static void test_ex_parsing() {
  ExCommand c = split_ex_command("e  foo.txt ");
  assert(c.name == "e" && c.args == "foo.txt");
  c = split_ex_command("%s/a/b/g");
  assert(c.name == "%s" && c.args == "s/a/b/g");
  c = split_ex_command("s/a/b/");
  assert(c.name == "s" && c.args == "s/a/b/");
  c = split_ex_command("q!");
  assert(c.name == "q!" && c.args.empty());

  assert(parse_line_number("42") == 42);
  assert(!parse_line_number("4a"));
  assert(!parse_line_number(""));
  assert(!parse_line_number("-1"));
  assert(trim("  x y \t") == "x y");
}

static void test_counts() {
  Input in;
  assert(!in.consumeDigit("0"));
  assert(in.consumeDigit("2"));
  in.push("d");
  assert(in.consumeDigit("3"));
  in.push("w");
  assert(in.pendingText() == "2d3w");
  assert(in.takeCount() == 6);

  in.reset();
  assert(in.consumeDigit("1"));
  assert(in.consumeDigit("0"));
  assert(in.takeCount() == 10);
  assert(in.takeCount() == 0);

  // long counts saturate instead of overflowing
  in.reset();
  for (int i = 0; i < 12; ++i) assert(in.consumeDigit("9"));
  assert(in.pendingText() == "99999999");
  in.push("d");
  for (int i = 0; i < 12; ++i) assert(in.consumeDigit("9"));
  assert(in.takeCount() == 99999999);

  in.reset();
  in.push("r");
  assert(!in.consumeDigit("5"));
}

static void test_command_table() {
  ParsedCommand pc = parse_normal_command({"d", "w"}, false);
  assert(pc.status == ParseStatus::Complete && pc.cmd == NormalCmd::DeleteMotion);
  assert(pc.motion == NormalCmd::WordForward);
  assert(parse_normal_command({"d"}, false).status == ParseStatus::Incomplete);
  assert(parse_normal_command({"d", "x"}, false).status == ParseStatus::Invalid);
  assert(parse_normal_command({"d", "d"}, false).cmd == NormalCmd::DeleteLine);
  pc = parse_normal_command({"y", "g", "g"}, false);
  assert(pc.cmd == NormalCmd::YankMotion && pc.motion == NormalCmd::GotoFirst);
  assert(parse_normal_command({"g", "g"}, false).cmd == NormalCmd::GotoFirst);
  assert(parse_normal_command({"q"}, true).cmd == NormalCmd::StopRecording);
  assert(parse_normal_command({"q"}, false).status == ParseStatus::Incomplete);
  assert(parse_normal_command({"@", "@"}, false).cmd == NormalCmd::PlayLastMacro);
  pc = parse_normal_command({"r", "5"}, false);
  assert(pc.cmd == NormalCmd::ReplaceChar && pc.arg == '5');
  pc = parse_normal_command({"\"", "a"}, false);
  assert(pc.cmd == NormalCmd::SelectRegister && pc.arg == 'a');
  assert(parse_normal_command({"Z"}, false).status == ParseStatus::Invalid);

  assert(is_linewise_motion(NormalCmd::Down));
  assert(!is_linewise_motion(NormalCmd::WordForward));
  assert(is_inclusive_motion(NormalCmd::WordEnd));
}

int main() {
  test_positions();
  test_classify();
  test_options();
  test_ex_parsing();
  test_counts();
  test_command_table();
  return 0;
}
