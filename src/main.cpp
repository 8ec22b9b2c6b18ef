#include <cstdio>
#include <filesystem>
#include <optional>
#include "app.hpp"
#include "ncurses_terminal.hpp"
#include "terminal.hpp"

int main(int argc, char** argv) {
  std::optional<std::filesystem::path> path;
  if (argc >= 2) path = std::filesystem::path(argv[1]);
  Terminal term;
  if (!term.ok()) {
    std::fprintf(stderr, "%s\n", term.error().c_str());
    return 1;
  }
  NcursesTerminal nterm;
  App app(nterm, path);
  app.load_rc();
  app.run();
  return 0;
}
