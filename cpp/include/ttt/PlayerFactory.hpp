#pragma once

#include "ttt/AbstractPlayerGenerator.hpp"

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ttt {

/*
 * Turns --player strings into player generators:
 *
 *   --player "--type=Perfect --name=CPU --seat=1 --move-delay-ms=500"
 *
 * --type picks the generator. --name and --seat are handled here; whatever is left goes to the
 * generator's own parse_args().
 */
class PlayerFactory {
 public:
  using generator_ptr_t = std::unique_ptr<AbstractPlayerGenerator>;
  using generator_maker_t = std::function<generator_ptr_t()>;

  struct PlayerGeneratorSeat {
    generator_ptr_t generator;
    int seat = -1;  // -1: first free seat
  };
  using player_generator_seat_vec_t = std::vector<PlayerGeneratorSeat>;

  struct Params {
    auto make_options_description();

    std::string type;
    std::string name;
    int seat = -1;
  };

  // Throws util::Exception if two makers produce generators answering to the same --type.
  explicit PlayerFactory(std::vector<generator_maker_t> makers);

  // TUI and Perfect.
  static PlayerFactory make_default();

  /*
   * One entry per --player string, in order. Unnamed generators get their default name, suffixed
   * with 2, 3, ... when that name is already in use.
   *
   * Throws util::CleanException on bad input.
   */
  player_generator_seat_vec_t parse(const std::vector<std::string>& player_strs);

  // Lists every type, then the type-specific options of each type mentioned in player_strs.
  void print_help(const std::vector<std::string>& player_strs, std::ostream& os);

 private:
  generator_ptr_t make_generator(const std::string& type) const;  // nullptr if no match
  std::vector<generator_ptr_t> make_all_generators() const;

  std::vector<generator_maker_t> makers_;
};

}  // namespace ttt

#include "inline/ttt/PlayerFactory.inl"
