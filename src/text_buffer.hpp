#pragma once
/*
 * TextBuffer
 *
 * Purpose: line-based text buffer supporting line ops and file I/O.
 * Feature: safe writes (write .tmp → fdatasync → atomic rename).
 * Invariant: never empty; an empty document is one empty line.
 */
#include <string>
#include <vector>
#include <filesystem>

class TextBuffer {
public:
  TextBuffer();

  int line_count() const;
  const std::string& line(int r) const;
  const std::vector<std::string>& lines() const { return lines_; }
  void ensure_not_empty();

  void init_from_lines(const std::vector<std::string>& lines);
  void init_from_lines(std::vector<std::string>&& lines);

  void insert_line(int row, const std::string& s);
  void insert_lines(int row, const std::vector<std::string>& ss);
  void erase_line(int row);
  void erase_lines(int start_row, int end_row);
  void replace_line(int row, const std::string& s);

  static TextBuffer from_file(const std::filesystem::path& path, std::string& msg, bool& ok);
  bool write_file(const std::filesystem::path& path, std::string& msg) const;

private:
  std::vector<std::string> lines_;
};
