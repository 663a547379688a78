#include "ttt/AbstractPlayerGenerator.hpp"

#include "util/Exception.hpp"

#include <algorithm>
#include <cctype>

namespace ttt {

inline void AbstractPlayerGenerator::set_name(const std::string& name) {
  auto valid_char = [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
  };
  if (name.empty() || !std::all_of(name.begin(), name.end(), valid_char)) {
    throw util::CleanException("Bad player name \"{}\": use letters, digits, '-' or '_'", name);
  }
  if (name.size() > static_cast<size_t>(kMaxNameLength)) {
    throw util::CleanException("Player name \"{}\" is longer than {} characters", name,
                               kMaxNameLength);
  }
  name_ = name;
}

inline AbstractPlayer* AbstractPlayerGenerator::generate_with_name() {
  AbstractPlayer* player = generate();
  player->set_name(name_);
  return player;
}

}  // namespace ttt
