#pragma once

#include "ttt/AbstractPlayer.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ttt {

/*
 * Makes players of one type, configured from the tokens of a --player "..." string. The
 * PlayerFactory picks the generator whose get_types() contains the --type value, strips --type,
 * --name and --seat, and passes the remaining tokens to parse_args().
 */
class AbstractPlayerGenerator {
 public:
  virtual ~AbstractPlayerGenerator() = default;

  virtual std::string get_default_name() const = 0;

  // Accepted --type values; the first is the canonical one and the rest are aliases.
  virtual std::vector<std::string> get_types() const = 0;

  // One line, shown next to the types in --help.
  virtual std::string get_description() const = 0;

  // The caller owns the returned player.
  virtual AbstractPlayer* generate() = 0;

  virtual void print_help(std::ostream&) {}
  virtual void parse_args(const std::vector<std::string>&) {}

  const std::string& get_name() const { return name_; }

  // Names are 1 to kMaxNameLength characters from [A-Za-z0-9_-]; anything else is a CleanException.
  void set_name(const std::string& name);

  AbstractPlayer* generate_with_name();

 private:
  std::string name_;
};

}  // namespace ttt

#include "inline/ttt/AbstractPlayerGenerator.inl"
