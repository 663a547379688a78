#pragma once

#include "ttt/DecisionEngine.hpp"
#include "ttt/GameServer.hpp"
#include "ttt/PlayerFactory.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace ttt {

struct Main {
  struct Args {
    std::vector<std::string> player_strs;
    std::string analyze_board_str;

    auto make_options_description();
  };

  // Used when no --player is given: a human at seat 0 (X) against a Perfect player at seat 1 (O).
  static std::vector<std::string> get_default_player_strs();

  /*
   * Registers the parsed players with server. Players with an explicit --seat are seated first;
   * the rest fill the remaining seats in command-line order.
   */
  static void register_players(GameServer& server,
                               PlayerFactory::player_generator_seat_vec_t& generator_seats);

  // Prints the per-move minimax scores and the best move for the side to move on board_str.
  static void analyze_board(const std::string& board_str, const DecisionEngine::Params& params,
                            std::ostream& os);

  static int main(int ac, char* av[]);
};

}  // namespace ttt

#include "inline/ttt/Main.inl"
