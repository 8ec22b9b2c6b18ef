#include <cassert>
#include <string>
#include <vector>
#include "search.hpp"

static const std::vector<std::string> L = {"foo bar", "baz foo", "Foo end"};

static void test_substring() {
  assert(find_substring("aaab", "ab", 0, false) == 2);
  assert(find_substring("aaab", "ab", 3, false) == -1);
  assert(find_substring("xAbC", "abc", 0, true) == 1);
  assert(find_substring("abc", "", 0, false) == -1);
  std::vector<int> hits;
  find_all("abab", "ab", false, hits);
  assert(hits == (std::vector<int>{0, 2}));
  find_all("aaaa", "aa", false, hits);
  assert(hits == (std::vector<int>{0, 1, 2}));
}

static void test_forward() {
  SearchOptions opt;
  auto hit = search_next(L, Position{0, 0}, "foo", opt);
  assert(hit && hit->pos == (Position{1, 4}) && !hit->wrapped);

  hit = search_next(L, Position{1, 4}, "foo", opt);
  assert(hit && hit->pos == (Position{0, 0}) && hit->wrapped);

  opt.ignore_case = true;
  hit = search_next(L, Position{1, 4}, "foo", opt);
  assert(hit && hit->pos == (Position{2, 0}) && !hit->wrapped);

  opt.ignore_case = false;
  opt.wrap_scan = false;
  assert(!search_next(L, Position{1, 4}, "foo", opt));
  assert(!search_next(L, Position{0, 0}, "missing", SearchOptions{}));

  // a sole match is found again after wrapping onto itself
  hit = search_next({"one x"}, Position{0, 4}, "x", SearchOptions{});
  assert(hit && hit->pos == (Position{0, 4}) && hit->wrapped);
}

static void test_backward() {
  SearchOptions opt;
  auto hit = search_previous(L, Position{1, 4}, "foo", opt);
  assert(hit && hit->pos == (Position{0, 0}) && !hit->wrapped);

  hit = search_previous(L, Position{0, 0}, "foo", opt);
  assert(hit && hit->pos == (Position{1, 4}) && hit->wrapped);

  hit = search_previous({"ab ab ab"}, Position{0, 7}, "ab", opt);
  assert(hit && hit->pos == (Position{0, 6}));

  opt.wrap_scan = false;
  assert(!search_previous(L, Position{0, 0}, "foo", opt));
}

static void test_word_under_cursor() {
  int start = -1;
  assert(word_under_cursor({"  hello, world"}, Position{0, 0}, &start) == "hello");
  assert(start == 2);
  assert(word_under_cursor({"  hello, world"}, Position{0, 7}, &start) == "world");
  assert(start == 9);
  assert(word_under_cursor({"  hello, world"}, Position{0, 4}, &start) == "hello");
  assert(start == 2);
  assert(word_under_cursor({"   "}, Position{0, 1}).empty());
}

int main() {
  test_substring();
  test_forward();
  test_backward();
  test_word_under_cursor();
  return 0;
}
