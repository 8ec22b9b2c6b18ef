#include "macro_recorder.hpp"

void MacroRecorder::start(char reg) {
  recording_ = true;
  target_ = reg;
  keys_.clear();
}

void MacroRecorder::stop() {
  if (!recording_) return;
  macros_[target_] = std::move(keys_);
  keys_.clear();
  recording_ = false;
}

void MacroRecorder::record(const std::string& key) {
  if (recording_) keys_.push_back(key);
}

void MacroRecorder::drop_last() {
  if (!keys_.empty()) keys_.pop_back();
}

const std::vector<std::string>* MacroRecorder::find(char reg) const {
  auto it = macros_.find(reg);
  if (it == macros_.end()) return nullptr;
  return &it->second;
}
