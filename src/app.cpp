#include "app.hpp"
#include <algorithm>
#include <cstdlib>
#include <vector>
#include "config.hpp"
#include "ex_command.hpp"
#include "file_reader.hpp"
#include "keys.hpp"

static const char* kUnsavedMsg = "No write since last change (add ! to override)";

App::App(ITerminal& term, const std::optional<std::filesystem::path>& file)
    : term_(term), interp_(doc_, *this) {
  if (file) {
    std::string msg;
    if (doc_.load(*file, msg)) show_message(msg);
    else show_error(msg);
  }
  view_.number = interp_.options().number();
  view_.relativenumber = interp_.options().relativenumber();
  view_.wrap = interp_.options().wrap();
}

void App::run() {
  while (!should_quit_) {
    render();
    std::string key = key_symbol(term_.read_key());
    if (key.empty()) continue;
    handle_key(key);
  }
}

void App::handle_key(const std::string& key) {
  message_.clear();
  message_is_error_ = false;
  // Ctrl+i arrives as Tab
  if (interp_.mode() == Mode::Normal && interp_.pending_keys().empty()) {
    if (key == "Ctrl+o") { if (!interp_.jump_back()) show_error("at start of jump list"); return; }
    if (key == "Tab") { if (!interp_.jump_forward()) show_error("at end of jump list"); return; }
  }
  bool consumed = interp_.handle_key(key);
  if (!consumed && interp_.mode() == Mode::Insert) doc_.type_key(key);
  if (interp_.mode() != Mode::Insert) doc_.end_insert_session();
}

void App::load_rc() {
  std::error_code ec;
  const char* home = std::getenv("HOME");
  if (!home) return;
  auto p = std::filesystem::path(home) / VK_RC_FILE;
  if (!std::filesystem::exists(p, ec)) return;
  std::vector<std::string> lines; std::string msg;
  if (!mmap_readlines(p, lines, msg)) { show_error(msg); return; }
  for (const auto& raw : lines) {
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    interp_.execute_ex(s);
  }
}

void App::request_save() {
  std::string msg;
  save_failed_ = !doc_.save(msg);
  if (save_failed_) show_error(msg);
  else show_message(msg);
}

void App::request_load(const std::string& path) {
  if (doc_.modified()) { show_error(kUnsavedMsg); return; }
  std::string msg;
  if (doc_.load(path, msg)) {
    vp_ = Viewport{};
    show_message(msg);
  } else {
    show_error(msg);
  }
}

void App::request_close(bool force) {
  if (!force && (save_failed_ || doc_.modified())) {
    save_failed_ = false;
    if (message_.empty()) show_error(kUnsavedMsg);
    return;
  }
  should_quit_ = true;
}

std::optional<std::string> App::prompt(const std::string& label) {
  prompt_label_ = label;
  prompt_text_.clear();
  std::optional<std::string> result;
  for (;;) {
    render();
    std::string key = key_symbol(term_.read_key());
    if (key == "Escape") break;
    if (key == "Enter") { result = prompt_text_; break; }
    if (key == "Backspace") {
      if (prompt_text_.empty()) break;
      prompt_text_.pop_back();
    } else if (key == "Tab") {
      prompt_text_ += '\t';
    } else if (key.size() == 1) {
      prompt_text_ += key;
    }
  }
  prompt_label_.clear();
  prompt_text_.clear();
  return result;
}

void App::option_changed(const std::string& name, bool value) {
  if (name == "number") view_.number = value;
  else if (name == "relativenumber") view_.relativenumber = value;
  else if (name == "wrap") { view_.wrap = value; vp_.left_col = 0; }
}

void App::show_message(const std::string& text) {
  message_ = text;
  message_is_error_ = false;
}

void App::show_error(const std::string& text) {
  message_ = text;
  message_is_error_ = true;
}

void App::forward_key(const std::string& key) {
  if (interp_.mode() == Mode::Insert) doc_.type_key(key);
}

int App::page_lines() const {
  return std::max(1, term_.get_size().rows - 1);
}

void App::render() {
  RenderInfo info;
  info.buf = &doc_.buffer();
  info.cur = doc_.cursor();
  info.mode = interp_.mode();
  info.file_path = doc_.path();
  info.modified = doc_.modified();
  info.visual_active = interp_.visual_active();
  info.visual_anchor = interp_.visual_anchor();
  info.pending = interp_.pending_keys();
  info.recording = interp_.macros().recording() ? interp_.macros().target() : 0;
  info.message = message_;
  info.message_is_error = message_is_error_;
  info.cmdline = interp_.command_line();
  info.prompt_label = prompt_label_;
  info.prompt_text = prompt_text_;
  renderer_.render(term_, info, view_, vp_);
}
