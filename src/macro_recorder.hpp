#pragma once
/*
 * MacroRecorder
 *
 * Purpose: record key symbols into a named slot and hand them back for replay.
 * Note: playback itself belongs to the Interpreter so replayed keys run through handle_key.
 */
#include <string>
#include <unordered_map>
#include <vector>

class MacroRecorder {
public:
  void start(char reg);
  void stop();
  void record(const std::string& key);
  // drops the newest recorded key (the 'q' that ends a recording)
  void drop_last();

  bool recording() const { return recording_; }
  char target() const { return target_; }
  const std::vector<std::string>& pending_keys() const { return keys_; }
  const std::vector<std::string>* find(char reg) const;

private:
  bool recording_ = false;
  char target_ = 0;
  std::vector<std::string> keys_;
  std::unordered_map<char, std::vector<std::string>> macros_;
};
