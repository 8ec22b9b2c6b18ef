#include "renderer.hpp"
#include <algorithm>
#include <cstdlib>

// selected columns [start, end) of a line, end == -1 means through end of line
static bool selection_span(const RenderInfo& info, int line_idx, int& start, int& end) {
  if (!info.visual_active) return false;
  Range r = normalize(info.visual_anchor, info.cur);
  if (line_idx < r.start.row || line_idx > r.end.row) return false;
  switch (info.mode) {
    case Mode::VisualLine:
      start = 0; end = -1;
      return true;
    case Mode::VisualBlock:
      start = std::min(info.visual_anchor.col, info.cur.col);
      end = std::max(info.visual_anchor.col, info.cur.col) + 1;
      return true;
    default:
      start = line_idx == r.start.row ? r.start.col : 0;
      end = line_idx == r.end.row ? r.end.col + 1 : -1;
      return true;
  }
}

static int segments_for(int len, int text_cols) {
  if (text_cols <= 0 || len <= text_cols) return 1;
  return (len + text_cols - 1) / text_cols;
}

int Renderer::gutter_width(const RenderInfo& info, const ViewOptions& view) const {
  if (!view.number && !view.relativenumber) return 0;
  int digits = 1;
  int total = std::max(1, info.buf->line_count());
  while (total >= 10) { total /= 10; digits++; }
  return std::max(3, digits) + 1; // one space after numbers
}

void Renderer::draw_gutter(ITerminal& term, int screen_row, int line_idx, int width, const RenderInfo& info,
                           const ViewOptions& view) const {
  if (width == 0) return;
  int shown = line_idx + 1;
  bool left_align = false;
  if (view.relativenumber) {
    int dist = std::abs(line_idx - info.cur.row);
    if (dist == 0) {
      shown = view.number ? line_idx + 1 : 0;
      left_align = view.number;
    } else {
      shown = dist;
    }
  }
  std::string num = std::to_string(shown);
  std::string pad(std::max(0, width - 1 - static_cast<int>(num.size())), ' ');
  term.draw_text(screen_row, 0, left_align ? num + pad + " " : pad + num + " ");
}

void Renderer::render(ITerminal& term, const RenderInfo& info, const ViewOptions& view, Viewport& vp) {
  const TextBuffer& buf = *info.buf;
  TermSize sz = term.get_size();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  int max_text_rows = std::max(1, rows - 1);
  int indent = gutter_width(info, view);
  int text_cols = std::max(1, cols - indent);

  if (info.cur.row < vp.top_line) vp.top_line = info.cur.row;
  if (view.wrap) {
    vp.left_col = 0;
    // the cursor's screen row must fit below top_line
    auto rows_to_cursor = [&]() {
      int used = 0;
      for (int r = vp.top_line; r < info.cur.row; ++r) used += segments_for((int)buf.line(r).size(), text_cols);
      return used + info.cur.col / text_cols + 1;
    };
    while (vp.top_line < info.cur.row && rows_to_cursor() > max_text_rows) vp.top_line++;
  } else {
    if (info.cur.row >= vp.top_line + max_text_rows) vp.top_line = info.cur.row - max_text_rows + 1;
    if (info.cur.col < vp.left_col) vp.left_col = info.cur.col;
    else if (info.cur.col >= vp.left_col + text_cols) vp.left_col = info.cur.col - text_cols + 1;
    if (vp.left_col < 0) vp.left_col = 0;
  }

  int screen_row = 0;
  int cursor_row = -1, cursor_col = indent;
  for (int line_idx = vp.top_line; line_idx < buf.line_count() && screen_row < max_text_rows; ++line_idx) {
    const std::string& s = buf.line(line_idx);
    int len = static_cast<int>(s.size());
    int hs = 0, he = 0;
    bool selected = selection_span(info, line_idx, hs, he);
    if (selected && he < 0) he = std::max(len, 1);

    int seg_start = view.wrap ? 0 : std::min(vp.left_col, len);
    int seg_count = view.wrap ? segments_for(len, text_cols) : 1;
    for (int seg = 0; seg < seg_count && screen_row < max_text_rows; ++seg) {
      int from = seg_start + seg * (view.wrap ? text_cols : 0);
      int n = std::max(0, std::min(len - from, text_cols));
      std::string vis = s.substr(std::min(from, len), n);
      if (seg == 0) draw_gutter(term, screen_row, line_idx, indent, info, view);
      if (selected && he > from && hs < from + std::max(n, 1)) {
        term.draw_highlighted(screen_row, indent, vis, hs - from, std::min(he, from + std::max(n, 1)) - std::max(hs, from));
      } else {
        term.draw_text(screen_row, indent, vis);
      }
      term.clear_to_eol(screen_row, indent + n);
      if (line_idx == info.cur.row) {
        int rel = info.cur.col - from;
        bool last = seg + 1 == seg_count;
        if (rel >= 0 && (rel < text_cols || (!view.wrap && last)) && cursor_row < 0) {
          cursor_row = screen_row;
          cursor_col = indent + std::min(rel, text_cols - 1);
        }
      }
      screen_row++;
    }
  }
  for (; screen_row < max_text_rows; ++screen_row) {
    term.draw_text(screen_row, 0, "~");
    term.clear_to_eol(screen_row, 1);
  }

  int status_row = rows - 1;
  draw_status(term, status_row, cols, info);
  if (!info.prompt_label.empty()) {
    term.move_cursor(status_row, static_cast<int>(info.prompt_label.size() + info.prompt_text.size()));
  } else if (info.mode == Mode::CommandLine) {
    term.move_cursor(status_row, 1 + static_cast<int>(info.cmdline.size()));
  } else {
    term.move_cursor(cursor_row < 0 ? 0 : cursor_row, cursor_col);
  }
  term.refresh();
}

void Renderer::draw_status(ITerminal& term, int row, int cols, const RenderInfo& info) const {
  if (!info.prompt_label.empty()) {
    term.draw_text(row, 0, info.prompt_label + info.prompt_text);
    term.clear_to_eol(row, static_cast<int>(info.prompt_label.size() + info.prompt_text.size()));
    return;
  }
  if (info.mode == Mode::CommandLine) {
    term.draw_text(row, 0, ":" + info.cmdline);
    term.clear_to_eol(row, 1 + static_cast<int>(info.cmdline.size()));
    return;
  }
  std::string status = std::string("-- ") + mode_name(info.mode) + " --  ";
  status += info.file_path ? info.file_path->filename().string() : std::string("[No Name]");
  if (info.modified) status += " [+]";
  status += "  " + std::to_string(info.cur.row + 1) + "," + std::to_string(info.cur.col + 1);
  if (info.recording) status += std::string("  recording @") + info.recording;
  if (!info.pending.empty()) status += "  " + info.pending;
  if ((int)status.size() > cols) status.resize(std::max(0, cols));
  term.draw_text(row, 0, status);
  int col = static_cast<int>(status.size());
  if (!info.message.empty() && col + 3 < cols) {
    std::string msg = info.message.substr(0, cols - col - 3);
    term.draw_text(row, col, " | ");
    if (info.message_is_error) term.draw_error(row, col + 3, msg);
    else term.draw_text(row, col + 3, msg);
    col += 3 + static_cast<int>(msg.size());
  }
  term.clear_to_eol(row, col);
}
