#pragma once

#include "ttt/AbstractPlayer.hpp"
#include "ttt/Constants.hpp"
#include "ttt/Game.hpp"
#include "ttt/Outcome.hpp"

#include <iostream>

namespace ttt {

/*
 * Reads move indices from a text stream. Input that is not an integer, or that names a move
 * Game::Rules::apply_move() would reject, is answered with "Invalid input!" and a fresh prompt.
 *
 * Running out of input raises util::CleanException, which ends the program cleanly.
 */
class HumanTuiPlayer : public AbstractPlayer {
 public:
  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout,
                 bool clear_screen = true)
      : in_(in), out_(out), clear_screen_(clear_screen) {}

  bool start_game() override;
  void receive_state_change(seat_index_t, const Board&, action_t) override;
  action_t get_move(const Board&) override;
  void end_game(const Board&, const Outcome&) override;

 protected:
  /*
   * Prompts once and returns the parsed index, or -1 if the line could not be parsed.
   */
  virtual action_t prompt_for_move();

  virtual void print_board(const Board&);

 private:
  void maybe_clear_screen();

  std::istream& in_;
  std::ostream& out_;
  const bool clear_screen_;
  action_t last_action_ = -1;
};

}  // namespace ttt

#include "inline/ttt/players/HumanTuiPlayer.inl"
