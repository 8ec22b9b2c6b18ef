#include "text_buffer.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "file_reader.hpp"

static std::filesystem::path temp_path(const std::string& name) {
  return std::filesystem::temp_directory_path() / ("vimkeys_" + name);
}

static std::string slurp(const std::filesystem::path& p) {
  std::ifstream in(p, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void test_line_ops() {
  TextBuffer b;
  assert(b.line_count() == 1);
  assert(b.line(0).empty());
  b.init_from_lines(std::vector<std::string>{"a", "b", "c"});
  assert(b.line_count() == 3);
  b.insert_line(1, "x");
  assert(b.line_count() == 4);
  assert(b.line(1) == std::string("x"));
  b.erase_line(2);
  assert(b.line_count() == 3);
  assert(b.line(0) == std::string("a"));
  assert(b.line(1) == std::string("x"));
  assert(b.line(2) == std::string("c"));
  b.replace_line(2, "z");
  assert(b.line(2) == std::string("z"));
  b.erase_lines(1, 3);
  assert(b.line_count() == 1);
  assert(b.line(0) == std::string("a"));
  b.insert_lines(1, {"p", "q"});
  assert(b.lines() == (std::vector<std::string>{"a", "p", "q"}));
  b.erase_lines(0, 3);
  assert(b.line_count() == 1);
  assert(b.line(0).empty());
  b.init_from_lines(std::vector<std::string>{});
  assert(b.line_count() == 1);
}

static void test_file_round_trip() {
  auto p = temp_path("round_trip.txt");
  TextBuffer b;
  b.init_from_lines(std::vector<std::string>{"first", "", "third"});
  std::string msg;
  assert(b.write_file(p, msg));
  assert(msg.find("saved file") == 0);
  assert(slurp(p) == "first\n\nthird\n");
  assert(!std::filesystem::exists(std::filesystem::path(p.string() + ".tmp")));

  bool ok = false;
  TextBuffer r = TextBuffer::from_file(p, msg, ok);
  assert(ok);
  assert(r.lines() == b.lines());
  std::filesystem::remove(p);
}

static void test_reader_edge_cases() {
  auto p = temp_path("crlf.txt");
  {
    std::ofstream out(p, std::ios::binary);
    out << "a\r\nb\r\nc";
  }
  std::vector<std::string> lines;
  std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines == (std::vector<std::string>{"a", "b", "c"}));

  {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
  }
  assert(mmap_readlines(p, lines, msg));
  assert(lines == (std::vector<std::string>{""}));
  std::filesystem::remove(p);

  assert(!mmap_readlines(temp_path("does_not_exist.txt"), lines, msg));
  assert(msg.find("can not open file") == 0);
}

int main() {
  test_line_ops();
  test_file_round_trip();
  test_reader_edge_cases();
  return 0;
}
