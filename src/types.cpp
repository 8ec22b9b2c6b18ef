#include "types.hpp"

const char* mode_name(Mode mode) {
  switch (mode) {
    case Mode::Normal: return "NORMAL";
    case Mode::Insert: return "INSERT";
    case Mode::Visual: return "VISUAL";
    case Mode::VisualLine: return "V-LINE";
    case Mode::VisualBlock: return "V-BLOCK";
    case Mode::CommandLine: return "COMMAND";
    case Mode::Replace: return "REPLACE";
  }
  return "";
}
