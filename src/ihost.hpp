#pragma once
/*
 * IHost
 *
 * Purpose: requests the interpreter makes of the surrounding application.
 * Note: save/load/close are fire-and-forget; the host performs the I/O.
 */
#include <optional>
#include <string>

class IHost {
public:
  virtual ~IHost() = default;
  virtual void request_save() = 0;
  virtual void request_load(const std::string& path) = 0;
  virtual void request_close(bool force) = 0;
  // one line of free text; nullopt when cancelled
  virtual std::optional<std::string> prompt(const std::string& label) = 0;
  virtual void option_changed(const std::string& name, bool value) = 0;
  virtual void show_message(const std::string& text) = 0;
  virtual void show_error(const std::string& text) = 0;
  // replayed key the interpreter did not consume (Insert mode text during macro playback)
  virtual void forward_key(const std::string& key) = 0;
  virtual int page_lines() const = 0;
};
