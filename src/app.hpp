#pragma once
/*
 * App
 *
 * Purpose: the terminal host. Owns the Document, feeds translated keys to the Interpreter,
 *          performs the file I/O and prompts the Interpreter asks for, and renders after each key.
 * Loop: render -> read key -> handle, until a close request is granted.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "document.hpp"
#include "ihost.hpp"
#include "interpreter.hpp"
#include "iterminal.hpp"
#include "renderer.hpp"

class App : public IHost {
public:
  App(ITerminal& term, const std::optional<std::filesystem::path>& file);

  void run();
  // runs each line of $HOME/.vimkeysrc as an ex command
  void load_rc();
  void handle_key(const std::string& key);
  bool should_quit() const { return should_quit_; }
  const Document& document() const { return doc_; }
  const Interpreter& interpreter() const { return interp_; }
  const std::string& message() const { return message_; }

  void request_save() override;
  void request_load(const std::string& path) override;
  void request_close(bool force) override;
  std::optional<std::string> prompt(const std::string& label) override;
  void option_changed(const std::string& name, bool value) override;
  void show_message(const std::string& text) override;
  void show_error(const std::string& text) override;
  void forward_key(const std::string& key) override;
  int page_lines() const override;

private:
  void render();

  ITerminal& term_;
  Document doc_;
  Interpreter interp_;
  Renderer renderer_;
  Viewport vp_;
  ViewOptions view_;

  std::string message_;
  bool message_is_error_ = false;
  bool save_failed_ = false;
  bool should_quit_ = false;
  std::string prompt_label_;
  std::string prompt_text_;
};
