#pragma once
/*
 * IDocument
 *
 * Purpose: the buffer collaborator the interpreter edits through.
 * Rule: the interpreter reads whole line snapshots and writes the full text back;
 *       no diff or patch API is needed.
 */
#include <string>
#include <vector>
#include "types.hpp"

class IDocument {
public:
  virtual ~IDocument() = default;
  virtual std::vector<std::string> lines() const = 0;
  virtual Position cursor() const = 0;
  virtual void set_cursor(const Position& pos) = 0;
  virtual void replace_text(const std::vector<std::string>& lines) = 0;
  virtual bool modified() const = 0;
  virtual void undo() = 0;
  virtual void redo() = 0;
};
