#include "registers.hpp"
#include <cctype>

void RegisterStore::capture(char name, const std::string& text, bool linewise) {
  unsigned char uc = static_cast<unsigned char>(name);
  if (std::isupper(uc)) {
    // "A..."Z append to their lowercase slot; appending whole lines makes the slot linewise
    char lower = static_cast<char>(std::tolower(uc));
    Slot& slot = slots_[lower];
    slot.text += text;
    slot.linewise = slot.linewise || linewise;
    slots_[VK_DEFAULT_REGISTER] = slot;
    return;
  }
  slots_[name] = Slot{text, linewise};
  if (name != VK_DEFAULT_REGISTER) slots_[VK_DEFAULT_REGISTER] = Slot{text, linewise};
}

const std::string& RegisterStore::get(char name) const {
  static const std::string empty;
  unsigned char uc = static_cast<unsigned char>(name);
  if (std::isupper(uc)) name = static_cast<char>(std::tolower(uc));
  auto it = slots_.find(name);
  if (it == slots_.end()) return empty;
  return it->second.text;
}

bool RegisterStore::linewise(char name) const {
  unsigned char uc = static_cast<unsigned char>(name);
  if (std::isupper(uc)) name = static_cast<char>(std::tolower(uc));
  auto it = slots_.find(name);
  return it != slots_.end() && it->second.linewise;
}
