#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "document.hpp"

using Lines = std::vector<std::string>;

static void test_replace_and_undo() {
  Document doc(Lines{"one", "two"});
  assert(!doc.modified());
  doc.set_cursor(Position{5, 9});
  assert(doc.cursor() == (Position{1, 3}));

  doc.replace_text(Lines{"one"});
  assert(doc.lines() == (Lines{"one"}));
  assert(doc.modified());
  assert(doc.cursor().row == 0);
  doc.replace_text(Lines{"uno"});
  doc.undo();
  assert(doc.lines() == (Lines{"one"}));
  doc.undo();
  assert(doc.lines() == (Lines{"one", "two"}));
  doc.undo();
  assert(doc.lines() == (Lines{"one", "two"}));
  doc.redo();
  doc.redo();
  assert(doc.lines() == (Lines{"uno"}));

  doc.replace_text(Lines{});
  assert(doc.lines() == (Lines{""}));
}

static void test_typing() {
  Document doc(Lines{"ad"});
  doc.set_cursor(Position{0, 1});
  assert(doc.type_key("b"));
  assert(doc.type_key("c"));
  assert(doc.lines() == (Lines{"abcd"}));
  assert(doc.cursor() == (Position{0, 3}));
  assert(doc.type_key("Enter"));
  assert(doc.lines() == (Lines{"abc", "d"}));
  assert(doc.cursor() == (Position{1, 0}));
  assert(doc.type_key("Backspace"));
  assert(doc.lines() == (Lines{"abcd"}));
  assert(doc.cursor() == (Position{0, 3}));
  assert(doc.type_key("Tab"));
  assert(doc.lines() == (Lines{"abc\td"}));
  assert(doc.type_key("Delete"));
  assert(doc.lines() == (Lines{"abc\t"}));
  assert(doc.type_key("Home"));
  assert(doc.cursor().col == 0);
  assert(!doc.type_key("Ctrl+x"));

  // the whole typing session is one undo step
  doc.end_insert_session();
  doc.undo();
  assert(doc.lines() == (Lines{"ad"}));
}

static void test_file_io() {
  auto p = std::filesystem::temp_directory_path() / "vimkeys_document.txt";
  std::filesystem::remove(p);
  Document doc;
  std::string msg;
  assert(!doc.save(msg));
  assert(msg == "no file name");

  assert(doc.load(p, msg));
  assert(msg.find("new file") == 0);
  assert(doc.path() && *doc.path() == p);
  doc.replace_text(Lines{"hello", "world"});
  assert(doc.save(msg));
  assert(!doc.modified());

  Document other;
  assert(other.load(p, msg));
  assert(other.lines() == (Lines{"hello", "world"}));
  assert(!other.modified());
  std::filesystem::remove(p);
}

int main() {
  test_replace_and_undo();
  test_typing();
  test_file_io();
  return 0;
}
