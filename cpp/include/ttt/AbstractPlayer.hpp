#pragma once

#include "ttt/Constants.hpp"
#include "ttt/Game.hpp"
#include "ttt/Outcome.hpp"

#include <string>

namespace ttt {

/*
 * A seat at the GameServer's table. For each round the server calls, in order:
 *
 *   start_game()                      once; returning false aborts the run
 *   get_move(board)                   whenever this player's mark is to move
 *   receive_state_change(seat, b, a)  after every applied move, including this player's own
 *   end_game(board, outcome)          once, with the final board
 *
 * The server applies the returned move with Game::Rules::apply_move(). An illegal move there is a
 * player bug and propagates as InvalidMove.
 */
class AbstractPlayer {
 public:
  using Board = Game::Board;
  using player_name_array_t = Game::player_name_array_t;

  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  const player_name_array_t& get_player_names() const { return player_names_; }
  seat_index_t get_my_seat() const { return my_seat_; }
  cell_t get_my_mark() const { return seat_to_mark(my_seat_); }

  void init_game(const player_name_array_t& player_names, seat_index_t seat_assignment) {
    player_names_ = player_names;
    my_seat_ = seat_assignment;
  }

  virtual bool start_game() { return true; }

  virtual void receive_state_change(seat_index_t, const Board&, action_t) {}

  // board is the one last passed to receive_state_change(), with this player's mark to move.
  virtual action_t get_move(const Board& board) = 0;

  virtual void end_game(const Board&, const Outcome&) {}

 private:
  std::string name_;
  player_name_array_t player_names_;
  seat_index_t my_seat_ = -1;
};

}  // namespace ttt
