#pragma once
/*
 * Options
 *
 * Purpose: the fixed table of boolean `:set` options and their short names.
 * Forms: name, noname, invname / name!, name?
 */
#include <optional>
#include <string>
#include <vector>

enum class OptionAction { Set, Clear, Toggle, Query };

struct OptionRequest {
  std::string name;  // canonical name, empty when unknown
  std::string token;
  OptionAction action = OptionAction::Set;
};

class Options {
public:
  Options();
  // canonical name for a full or short name, empty when unknown
  std::string canonical(const std::string& name) const;
  std::optional<bool> get(const std::string& name) const;
  bool set(const std::string& name, bool value);
  const std::vector<std::string>& names() const { return names_; }

  bool number() const { return values_[0]; }
  bool relativenumber() const { return values_[1]; }
  bool wrap() const { return values_[2]; }
  bool ignorecase() const { return values_[3]; }
  bool wrapscan() const { return values_[4]; }

private:
  int index_of(const std::string& name) const;
  std::vector<std::string> names_;
  std::vector<std::string> short_names_;
  std::vector<bool> values_;
};

OptionRequest parse_option_token(const Options& opts, const std::string& token);
