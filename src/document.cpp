#include "document.hpp"
#include <algorithm>

Document::Document() {}

Document::Document(const std::vector<std::string>& lines) { buf_.init_from_lines(lines); }

std::vector<std::string> Document::lines() const { return buf_.lines(); }

void Document::clamp_cursor() {
  cur_.row = std::clamp(cur_.row, 0, buf_.line_count() - 1);
  cur_.col = std::clamp(cur_.col, 0, static_cast<int>(buf_.line(cur_.row).size()));
}

void Document::set_cursor(const Position& pos) {
  cur_ = pos;
  clamp_cursor();
}

void Document::replace_text(const std::vector<std::string>& lines) {
  end_insert_session();
  um_.begin_group(buf_, cur_);
  buf_.init_from_lines(lines);
  clamp_cursor();
  um_.commit_group(buf_, cur_);
  modified_ = true;
}

void Document::undo() {
  end_insert_session();
  if (um_.undo(buf_, cur_)) { clamp_cursor(); modified_ = true; }
}

void Document::redo() {
  end_insert_session();
  if (um_.redo(buf_, cur_)) { clamp_cursor(); modified_ = true; }
}

void Document::touch() {
  if (!um_.grouping()) um_.begin_group(buf_, cur_);
  modified_ = true;
}

void Document::end_insert_session() {
  if (um_.grouping()) um_.commit_group(buf_, cur_);
}

bool Document::type_key(const std::string& key) {
  clamp_cursor();
  std::string line = buf_.line(cur_.row);
  if (key == "Tab") return type_key("\t");
  if (key == "Space") return type_key(" ");
  if (key.size() == 1 && (static_cast<unsigned char>(key[0]) >= 32 || key[0] == '\t')) {
    touch();
    line.insert(line.begin() + cur_.col, key[0]);
    buf_.replace_line(cur_.row, line);
    cur_.col++;
    return true;
  }
  if (key == "Enter") {
    touch();
    buf_.replace_line(cur_.row, line.substr(0, cur_.col));
    buf_.insert_line(cur_.row + 1, line.substr(cur_.col));
    cur_.row++;
    cur_.col = 0;
    return true;
  }
  if (key == "Backspace") {
    if (cur_.col > 0) {
      touch();
      line.erase(line.begin() + cur_.col - 1);
      buf_.replace_line(cur_.row, line);
      cur_.col--;
    } else if (cur_.row > 0) {
      touch();
      std::string prev = buf_.line(cur_.row - 1);
      buf_.replace_line(cur_.row - 1, prev + line);
      buf_.erase_line(cur_.row);
      cur_.row--;
      cur_.col = static_cast<int>(prev.size());
    }
    return true;
  }
  if (key == "Delete") {
    if (cur_.col < static_cast<int>(line.size())) {
      touch();
      line.erase(line.begin() + cur_.col);
      buf_.replace_line(cur_.row, line);
    } else if (cur_.row + 1 < buf_.line_count()) {
      touch();
      buf_.replace_line(cur_.row, line + buf_.line(cur_.row + 1));
      buf_.erase_line(cur_.row + 1);
    }
    return true;
  }
  if (key == "Left") { if (cur_.col > 0) cur_.col--; return true; }
  if (key == "Right") { cur_.col++; clamp_cursor(); return true; }
  if (key == "Up") { cur_.row--; clamp_cursor(); return true; }
  if (key == "Down") { cur_.row++; clamp_cursor(); return true; }
  if (key == "Home") { cur_.col = 0; return true; }
  if (key == "End") { cur_.col = static_cast<int>(line.size()); return true; }
  return false;
}

bool Document::load(const std::filesystem::path& path, std::string& msg) {
  bool ok = false;
  TextBuffer b = TextBuffer::from_file(path, msg, ok);
  if (!ok) {
    // a missing file opens as a new empty buffer under that name
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) return false;
    b = TextBuffer();
    msg = std::string("new file: ") + path.string();
  }
  buf_ = std::move(b);
  path_ = path;
  um_.clear();
  cur_ = Position{};
  modified_ = false;
  return true;
}

bool Document::save(std::string& msg) {
  if (!path_) { msg = "no file name"; return false; }
  return save_as(*path_, msg);
}

bool Document::save_as(const std::filesystem::path& path, std::string& msg) {
  end_insert_session();
  if (!buf_.write_file(path, msg)) return false;
  path_ = path;
  modified_ = false;
  return true;
}
