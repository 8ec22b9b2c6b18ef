#include <cassert>
#include <string>
#include <vector>
#include "document.hpp"
#include "interpreter.hpp"
#include "recording_host.hpp"

using Lines = std::vector<std::string>;

struct Session {
  Document doc;
  RecordingHost host;
  Interpreter in;

  explicit Session(const Lines& lines) : doc(lines), host(doc), in(doc, host) {}
  void keys(const std::string& chars) { type(in, doc, chars); }
  void key(const std::string& k) { press(in, doc, k); }
  Lines text() const { return doc.lines(); }
  Position cur() const { return doc.cursor(); }
};

static void test_count_clamps_vertical_motion() {
  Session s({"a", "b", "c"});
  s.keys("5j");
  assert(s.cur() == (Position{2, 0}));
  s.keys("2k");
  assert(s.cur() == (Position{0, 0}));
  s.keys("10l");
  assert(s.cur() == (Position{0, 0}));
}

static void test_long_count_saturates() {
  Session s({"a b", "c", "d"});
  s.keys("99999999999j");
  assert(s.cur() == (Position{2, 0}));
  s.keys("99999999999k");
  assert(s.cur() == (Position{0, 0}));
  s.keys("99999999999w");
  assert(s.cur() == (Position{2, 0}));
  assert(s.in.pending_keys().empty());
}

static void test_delete_line_and_paste() {
  Session s({"one", "two", "three"});
  s.keys("dd");
  assert(s.text() == (Lines{"two", "three"}));
  assert(s.in.registers().get('"') == "one\n");
  s.keys("p");
  assert(s.text() == (Lines{"two", "one", "three"}));
  assert(s.cur() == (Position{1, 0}));
  s.keys("P");
  assert(s.text() == (Lines{"two", "one", "one", "three"}));
}

static void test_append_escape_returns_to_column() {
  Session s({"hello"});
  s.doc.set_cursor(Position{0, 2});
  s.keys("a");
  assert(s.in.mode() == Mode::Insert);
  assert(s.cur() == (Position{0, 3}));
  s.key("Escape");
  assert(s.in.mode() == Mode::Normal);
  assert(s.cur() == (Position{0, 2}));
}

static void test_yank_paste_twice() {
  Session s({"x", "y"});
  s.keys("yy");
  assert(!s.doc.modified());
  s.keys("pp");
  assert(s.text() == (Lines{"x", "x", "x", "y"}));
}

static void test_search_wraps() {
  Session s({"foo", "bar", "foo"});
  s.doc.set_cursor(Position{2, 0});
  s.host.answers.push_back(std::string("foo"));
  s.keys("/");
  assert(s.host.prompts.back() == "/");
  assert(s.cur() == (Position{0, 0}));
  assert(s.host.last_message() == "search hit BOTTOM, continuing at TOP");
  s.keys("n");
  assert(s.cur() == (Position{2, 0}));
  s.keys("N");
  assert(s.cur() == (Position{0, 0}));
  s.keys("N");
  assert(s.cur() == (Position{2, 0}));
  assert(s.host.last_message() == "search hit TOP, continuing at BOTTOM");

  // cancelled and empty prompts
  s.host.answers.push_back(std::nullopt);
  s.keys("/");
  assert(s.cur() == (Position{2, 0}));
  s.host.answers.push_back(std::string());
  s.keys("/");
  assert(s.cur() == (Position{0, 0}));
  assert(s.in.last_search() == "foo");

  s.host.answers.push_back(std::string("zzz"));
  s.keys("?");
  assert(s.cur() == (Position{0, 0}));
  assert(s.host.last_message() == "pattern not found: zzz");
  assert(!s.in.last_search_forward());
}

static void test_search_options() {
  Session s({"foo", "bar", "FOO"});
  s.in.execute_ex("set nows");
  s.host.answers.push_back(std::string("bar"));
  s.keys("/");
  assert(s.cur() == (Position{1, 0}));
  s.keys("n");
  assert(s.cur() == (Position{1, 0}));
  assert(s.host.last_message() == "search hit BOTTOM without match for: bar");

  s.in.execute_ex("set ic");
  s.host.answers.push_back(std::string("foo"));
  s.keys("/");
  assert(s.cur() == (Position{2, 0}));
}

static void test_star_and_hash() {
  Session s({"foo bar", "xx foo"});
  s.keys("*");
  assert(s.cur() == (Position{1, 3}));
  assert(s.in.last_search() == "foo");
  assert(s.in.jumps().size() == 1);
  s.keys("#");
  assert(s.cur() == (Position{0, 0}));

  Session lone({"only word"});
  lone.doc.set_cursor(Position{0, 2});
  lone.keys("#");
  assert(lone.cur() == (Position{0, 2}));
}

static void test_substitute_first_vs_global() {
  Session s({"a a a"});
  s.key(":");
  assert(s.in.mode() == Mode::CommandLine);
  s.keys("s/a/b/");
  assert(s.in.command_line() == "s/a/b/");
  s.key("Enter");
  assert(s.in.mode() == Mode::Normal);
  assert(s.text() == (Lines{"b a a"}));

  Session g({"a a a"});
  g.key(":");
  g.keys("s/a/b/g");
  g.key("Enter");
  assert(g.text() == (Lines{"b b b"}));
}

static void test_marks_restore_position() {
  Session s({"hello", "  world"});
  s.doc.set_cursor(Position{1, 4});
  s.keys("ma");
  s.keys("gg");
  assert(s.cur() == (Position{0, 0}));
  s.keys("`a");
  assert(s.cur() == (Position{1, 4}));
  s.keys("gg'a");
  assert(s.cur() == (Position{1, 2}));
  // unset marks leave the cursor alone
  s.keys("`z");
  assert(s.cur() == (Position{1, 2}));
}

static void test_macro_replay() {
  Lines five = {"1", "2", "3", "4", "5"};
  Session s(five);
  s.keys("qa");
  assert(s.in.macros().recording());
  s.keys("dd");
  s.keys("q");
  assert(!s.in.macros().recording());
  assert(s.text().size() == 4);
  const auto* keys = s.in.macros().find('a');
  assert(keys && keys->size() == 2);

  s.doc.replace_text(five);
  s.doc.set_cursor(Position{0, 0});
  s.keys("3@a");
  assert(s.text() == (Lines{"4", "5"}));
  s.keys("@@");
  assert(s.text() == (Lines{"5"}));
}

static void test_macro_with_insert_text() {
  Session s({"a", "b"});
  s.keys("qqAx");
  s.key("Escape");
  s.keys("jq");
  assert(s.text() == (Lines{"ax", "b"}));
  s.keys("@q");
  assert(s.text() == (Lines{"ax", "bx"}));
  assert(s.in.mode() == Mode::Normal);
}

static void test_macro_recursion_is_bounded() {
  Session s({"x", "y"});
  s.keys("qa@aq");
  s.keys("@a");
  assert(s.host.last_error().find("recursion") != std::string::npos);
  assert(s.host.errors.size() == 1);
  s.keys("x");
  assert(s.text() == (Lines{"", "y"}));
}

static void test_quit_refused_when_modified() {
  Session s({"abc"});
  s.keys("x");
  assert(s.doc.modified());
  assert(s.in.execute_ex("q") == ExStatus::UnsavedCloseBlocked);
  assert(s.host.closes.empty());
  assert(s.host.last_error() == "No write since last change (add ! to override)");
  assert(s.in.execute_ex("q!") == ExStatus::Ok);
  assert(s.host.closes == (std::vector<bool>{true}));
}

static void test_counts_and_operators() {
  Session s({"abcdef"});
  s.keys("3x");
  assert(s.text() == (Lines{"def"}));
  assert(s.in.registers().get('"') == "abc");

  Session w({"a b c d e f g h"});
  w.keys("2d3w");
  assert(w.text() == (Lines{"g h"}));

  Session end({"foo bar"});
  end.doc.set_cursor(Position{0, 4});
  end.keys("dw");
  assert(end.text() == (Lines{"foo "}));
  assert(end.cur() == (Position{0, 3}));

  Session e({"foo bar"});
  e.keys("de");
  assert(e.text() == (Lines{" bar"}));

  Session d({"foo bar"});
  d.doc.set_cursor(Position{0, 4});
  d.keys("d$");
  assert(d.text() == (Lines{"foo "}));

  Session d0({"foo bar"});
  d0.doc.set_cursor(Position{0, 4});
  d0.keys("d0");
  assert(d0.text() == (Lines{"bar"}));

  Session lines({"1", "2", "3", "4"});
  lines.doc.set_cursor(Position{1, 0});
  lines.keys("dj");
  assert(lines.text() == (Lines{"1", "4"}));
  lines.keys("dG");
  assert(lines.text() == (Lines{"1"}));

  Session y({"foo bar"});
  y.keys("yw");
  assert(y.in.registers().get('"') == "foo ");
  assert(!y.doc.modified());
}

static void test_change_word() {
  Session s({"foo bar"});
  s.keys("cw");
  assert(s.in.mode() == Mode::Insert);
  assert(s.text() == (Lines{" bar"}));
  s.keys("baz");
  s.key("Escape");
  assert(s.text() == (Lines{"baz bar"}));
  assert(s.cur() == (Position{0, 2}));

  Session c({"keep this"});
  c.doc.set_cursor(Position{0, 4});
  c.keys("C");
  assert(c.in.mode() == Mode::Insert);
  assert(c.text() == (Lines{"keep"}));

  Session cc({"  a", "b"});
  cc.keys("cc");
  assert(cc.text() == (Lines{"", "b"}));
  assert(cc.in.mode() == Mode::Insert);
}

static void test_repeat() {
  Session s({"abcdef"});
  s.keys("x.");
  assert(s.text() == (Lines{"cdef"}));

  Session d({"1", "2", "3"});
  d.keys("dd.");
  assert(d.text() == (Lines{"3"}));

  // `.` replays whatever command ran last, motions included
  Session m({"a", "b", "c", "d"});
  m.keys("j.");
  assert(m.cur() == (Position{2, 0}));
  m.keys("G2k");
  assert(m.cur() == (Position{1, 0}));
  m.keys("j.");
  assert(m.cur() == (Position{3, 0}));

  Session y({"abc", "def"});
  y.keys("xj.");
  assert(y.text() == (Lines{"bc", "def"}));
  assert(y.cur() == (Position{1, 0}));
  y.keys("x.");
  assert(y.text() == (Lines{"bc", "f"}));
}

static void test_undo_redo() {
  Session s({"1", "2"});
  s.keys("dd");
  assert(s.text() == (Lines{"2"}));
  s.keys("u");
  assert(s.text() == (Lines{"1", "2"}));
  s.key("Ctrl+r");
  assert(s.text() == (Lines{"2"}));
}

static void test_visual_modes() {
  Session s({"hello world"});
  s.keys("ved");
  assert(s.in.mode() == Mode::Normal);
  assert(s.text() == (Lines{" world"}));
  assert(s.in.registers().get('"') == "hello");

  Session l({"a", "b", "c"});
  l.keys("Vjy");
  assert(l.in.registers().get('"') == "a\nb\n");
  assert(l.cur() == (Position{0, 0}));
  l.keys("Vjd");
  assert(l.text() == (Lines{"c"}));

  Session b({"abcd", "efgh"});
  b.doc.set_cursor(Position{0, 1});
  b.key("Ctrl+v");
  assert(b.in.mode() == Mode::VisualBlock);
  b.keys("jld");
  assert(b.text() == (Lines{"ad", "eh"}));

  Session o({"abcdef"});
  o.keys("vll");
  assert(o.in.visual_anchor() == (Position{0, 0}));
  o.keys("o");
  assert(o.cur() == (Position{0, 0}));
  assert(o.in.visual_anchor() == (Position{0, 2}));
  o.keys("V");
  assert(o.in.mode() == Mode::VisualLine);
  o.keys("V");
  assert(o.in.mode() == Mode::Normal);

  Session c({"abc"});
  c.keys("vlc");
  assert(c.in.mode() == Mode::Insert);
  assert(c.text() == (Lines{"c"}));

  // a charwise selection ending on an empty line pastes inline, not as a line
  Session e({"abc", "", "xyz"});
  e.keys("vjy");
  assert(e.in.registers().get('"') == "abc\n");
  assert(!e.in.registers().linewise('"'));
  e.keys("Gp");
  assert(e.text() == (Lines{"abc", "", "xabc", "yz"}));
}

static void test_replace_mode_and_r() {
  Session s({"abc"});
  s.keys("R");
  assert(s.in.mode() == Mode::Replace);
  s.keys("xyzw");
  assert(s.text() == (Lines{"xyzw"}));
  s.key("Escape");
  assert(s.in.mode() == Mode::Normal);
  assert(s.cur() == (Position{0, 3}));

  // Backspace puts back what this Replace session overwrote
  Session b({"abc"});
  b.doc.set_cursor(Position{0, 1});
  b.keys("RXYZ");
  assert(b.text() == (Lines{"aXYZ"}));
  b.key("Backspace");
  assert(b.text() == (Lines{"aXY"}));
  b.key("Backspace");
  b.key("Backspace");
  assert(b.text() == (Lines{"abc"}));
  assert(b.cur() == (Position{0, 1}));
  b.key("Backspace");
  assert(b.text() == (Lines{"abc"}));
  assert(b.cur() == (Position{0, 0}));
  b.key("Escape");

  Session r({"abc"});
  r.keys("rx");
  assert(r.text() == (Lines{"xbc"}));
  r.keys("3r1");
  assert(r.text() == (Lines{"111"}));
  assert(r.cur() == (Position{0, 2}));
  r.keys("5r2");
  assert(r.text() == (Lines{"111"}));
}

static void test_named_registers() {
  Session s({"one", "two"});
  s.keys("\"add");
  assert(s.in.registers().get('a') == "one\n");
  assert(s.in.registers().active() == '"');
  s.keys("\"ap");
  assert(s.text() == (Lines{"two", "one"}));
  s.keys("\"Ayy");
  assert(s.in.registers().get('a') == "one\none\n");
}

static void test_jumps() {
  Session s({"1", "2", "3", "4"});
  s.keys("2G");
  assert(s.cur() == (Position{1, 0}));
  s.keys("G");
  assert(s.cur() == (Position{3, 0}));
  assert(s.in.jumps().size() == 2);
  assert(s.in.jump_back());
  assert(s.cur() == (Position{1, 0}));
  assert(s.in.jump_back());
  assert(s.cur() == (Position{0, 0}));
  assert(!s.in.jump_back());
  assert(s.in.jump_forward());
  assert(s.in.jump_forward());
  assert(s.cur() == (Position{3, 0}));

  Session b({"f(x)"});
  b.keys("%");
  assert(b.cur() == (Position{0, 3}));
  b.keys("%");
  assert(b.cur() == (Position{0, 1}));
}

static void test_insert_commands() {
  Session s({"  text"});
  s.doc.set_cursor(Position{0, 4});
  s.keys("I");
  assert(s.cur() == (Position{0, 2}));
  s.key("Escape");
  s.keys("A");
  assert(s.cur() == (Position{0, 6}));
  s.key("Escape");
  s.keys("o");
  assert(s.text() == (Lines{"  text", ""}));
  assert(s.cur() == (Position{1, 0}));
  s.key("Escape");
  s.keys("O");
  assert(s.text() == (Lines{"  text", "", ""}));
  s.key("Escape");
  s.keys("i");
  s.keys("hi");
  s.key("Escape");
  assert(s.text()[1] == "hi");
}

static void test_pending_and_unknown_keys() {
  Session s({"abc"});
  s.keys("2d");
  assert(s.in.pending_keys() == "2d");
  s.key("Escape");
  assert(s.in.pending_keys().empty());
  s.keys("x");
  assert(s.text() == (Lines{"bc"}));

  assert(!s.in.handle_key("Z"));
  assert(s.in.handle_key("d"));
  assert(!s.in.handle_key("q"));
  assert(s.in.pending_keys().empty());
  assert(s.text() == (Lines{"bc"}));
}

static void test_paging() {
  Lines many(50, "line");
  Session s(many);
  s.host.page = 20;
  s.key("Ctrl+d");
  assert(s.cur().row == 10);
  s.key("Ctrl+f");
  assert(s.cur().row == 30);
  s.key("Ctrl+u");
  assert(s.cur().row == 20);
  s.key("Ctrl+b");
  assert(s.cur().row == 0);
}

int main() {
  test_count_clamps_vertical_motion();
  test_long_count_saturates();
  test_delete_line_and_paste();
  test_append_escape_returns_to_column();
  test_yank_paste_twice();
  test_search_wraps();
  test_search_options();
  test_star_and_hash();
  test_substitute_first_vs_global();
  test_marks_restore_position();
  test_macro_replay();
  test_macro_with_insert_text();
  test_macro_recursion_is_bounded();
  test_quit_refused_when_modified();
  test_counts_and_operators();
  test_change_word();
  test_repeat();
  test_undo_redo();
  test_visual_modes();
  test_replace_mode_and_r();
  test_named_registers();
  test_jumps();
  test_insert_commands();
  test_pending_and_unknown_keys();
  test_paging();
  return 0;
}
