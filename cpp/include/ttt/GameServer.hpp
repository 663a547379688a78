#pragma once

#include "ttt/AbstractPlayer.hpp"
#include "ttt/Constants.hpp"
#include "ttt/Game.hpp"
#include "ttt/Outcome.hpp"
#include "ttt/Scoreboard.hpp"

#include <string>

namespace ttt {

/*
 * Runs rounds between two registered players. Each round starts from a fresh empty Board, optionally
 * advanced by a fixed sequence of initial actions, and then alternates get_move() calls until
 * Game::Rules::evaluate() reports a terminal outcome.
 *
 * The server owns the registered players.
 */
class GameServer {
 public:
  using Board = Game::Board;
  using action_vec_t = Game::action_vec_t;
  using player_name_array_t = Game::player_name_array_t;

  struct Params {
    auto make_options_description();

    int num_games = 1;  // if <=0, play indefinitely
    std::string initial_actions_str;
    bool print_game_states = false;
    bool announce_game_results = true;
  };

  /*
   * Throws util::CleanException if the initial actions do not parse, or do not form a legal
   * non-terminal opening.
   */
  GameServer(const Params&);
  ~GameServer();

  GameServer(const GameServer&) = delete;
  GameServer& operator=(const GameServer&) = delete;

  /*
   * Takes ownership of player. If seat is negative, the player takes the first free seat.
   */
  void register_player(seat_index_t seat, AbstractPlayer* player);
  int num_registered_players() const;

  // Plays params.num_games rounds, then logs the summary.
  void run();

  // Plays a single round and records it in the scoreboard.
  Outcome play_game();

  void print_summary() const;

  const Scoreboard& scoreboard() const { return scoreboard_; }
  const action_vec_t& initial_actions() const { return initial_actions_; }
  const player_name_array_t& player_names() const { return player_names_; }

  /*
   * Parses a comma-separated action list such as "4,0". Throws util::CleanException on
   * unparsable or out-of-range entries.
   */
  static action_vec_t parse_initial_actions(const std::string& str);

 private:
  // Applies action for whoever is to move and notifies both players.
  void apply_action(Board& board, action_t action);

  const Params params_;
  action_vec_t initial_actions_;
  AbstractPlayer* players_[kNumPlayers] = {};
  player_name_array_t player_names_;
  Scoreboard scoreboard_;
  int game_id_ = 0;
};

}  // namespace ttt

#include "inline/ttt/GameServer.inl"
