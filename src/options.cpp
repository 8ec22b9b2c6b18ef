#include "options.hpp"

Options::Options()
  : names_{"number", "relativenumber", "wrap", "ignorecase", "wrapscan"},
    short_names_{"nu", "rnu", "wrap", "ic", "ws"},
    values_{false, false, true, false, true} {}

int Options::index_of(const std::string& name) const {
  for (size_t i = 0; i < names_.size(); ++i) {
    if (names_[i] == name || short_names_[i] == name) return static_cast<int>(i);
  }
  return -1;
}

std::string Options::canonical(const std::string& name) const {
  int i = index_of(name);
  return i < 0 ? std::string() : names_[i];
}

std::optional<bool> Options::get(const std::string& name) const {
  int i = index_of(name);
  if (i < 0) return std::nullopt;
  return values_[i];
}

bool Options::set(const std::string& name, bool value) {
  int i = index_of(name);
  if (i < 0) return false;
  values_[i] = value;
  return true;
}

OptionRequest parse_option_token(const Options& opts, const std::string& token) {
  OptionRequest req;
  req.token = token;
  std::string name = token;
  if (!name.empty() && name.back() == '?') { req.action = OptionAction::Query; name.pop_back(); }
  else if (!name.empty() && name.back() == '!') { req.action = OptionAction::Toggle; name.pop_back(); }
  req.name = opts.canonical(name);
  if (!req.name.empty()) return req;
  // a `?` or `!` suffix wins over the prefix: `nonu?` queries nu
  OptionAction prefixed = OptionAction::Set;
  if (name.rfind("no", 0) == 0) {
    req.name = opts.canonical(name.substr(2));
    prefixed = OptionAction::Clear;
  } else if (name.rfind("inv", 0) == 0) {
    req.name = opts.canonical(name.substr(3));
    prefixed = OptionAction::Toggle;
  }
  if (!req.name.empty() && req.action == OptionAction::Set) req.action = prefixed;
  return req;
}
