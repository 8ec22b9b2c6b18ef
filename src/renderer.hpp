#pragma once
/*
 * Renderer
 *
 * Purpose: render the text area, line-number gutter, selection and status line; keep the viewport
 *          scrolled to the cursor.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless apart from the Viewport it is handed; receives snapshots from App.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "iterminal.hpp"
#include "text_buffer.hpp"
#include "types.hpp"

struct Viewport {
  int top_line = 0;
  int left_col = 0;
};

struct ViewOptions {
  bool number = false;
  bool relativenumber = false;
  bool wrap = true;
};

struct RenderInfo {
  const TextBuffer* buf = nullptr;
  Position cur{};
  Mode mode = Mode::Normal;
  std::optional<std::filesystem::path> file_path;
  bool modified = false;
  bool visual_active = false;
  Position visual_anchor{};
  std::string pending;
  char recording = 0;
  std::string message;
  bool message_is_error = false;
  std::string cmdline;
  // status-row prompt for / and ?; label empty when not prompting
  std::string prompt_label;
  std::string prompt_text;
};

class Renderer {
public:
  void render(ITerminal& term, const RenderInfo& info, const ViewOptions& view, Viewport& vp);

private:
  int gutter_width(const RenderInfo& info, const ViewOptions& view) const;
  void draw_gutter(ITerminal& term, int screen_row, int line_idx, int width, const RenderInfo& info,
                   const ViewOptions& view) const;
  void draw_status(ITerminal& term, int row, int cols, const RenderInfo& info) const;
};
