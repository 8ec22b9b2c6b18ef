#pragma once
/*
 * Document
 *
 * Purpose: the concrete buffer collaborator: lines, cursor, modified flag, undo history, file I/O.
 * Undo: each replace_text is one step; Insert-mode typing (type_key) stays in one
 *       group until end_insert_session() or the next replace_text.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "idocument.hpp"
#include "text_buffer.hpp"
#include "undo_manager.hpp"

class Document : public IDocument {
public:
  Document();
  explicit Document(const std::vector<std::string>& lines);

  std::vector<std::string> lines() const override;
  Position cursor() const override { return cur_; }
  void set_cursor(const Position& pos) override;
  void replace_text(const std::vector<std::string>& lines) override;
  bool modified() const override { return modified_; }
  void undo() override;
  void redo() override;

  // Insert-mode text entry: printable chars, Enter, Backspace, Tab, Delete, arrows
  bool type_key(const std::string& key);
  void end_insert_session();

  bool load(const std::filesystem::path& path, std::string& msg);
  bool save(std::string& msg);
  bool save_as(const std::filesystem::path& path, std::string& msg);

  const TextBuffer& buffer() const { return buf_; }
  const std::optional<std::filesystem::path>& path() const { return path_; }
  void set_modified(bool m) { modified_ = m; }

private:
  void clamp_cursor();
  void touch();

  TextBuffer buf_;
  UndoManager um_;
  Position cur_;
  std::optional<std::filesystem::path> path_;
  bool modified_ = false;
};
