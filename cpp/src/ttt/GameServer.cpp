#include "ttt/GameServer.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <iostream>
#include <sstream>

namespace ttt {

GameServer::GameServer(const Params& params)
    : params_(params), initial_actions_(parse_initial_actions(params.initial_actions_str)) {
  Board board;
  for (action_t action : initial_actions_) {
    try {
      Game::Rules::apply_move(board, action, Game::Rules::get_current_mark(board));
    } catch (const util::Exception& e) {
      throw util::CleanException("Invalid --initial-actions \"{}\": {}",
                                 params.initial_actions_str, e.what());
    }
  }
  CLEAN_ASSERT(!Game::Rules::evaluate(board).is_terminal(),
               "--initial-actions \"{}\" end the game before it starts",
               params.initial_actions_str);
}

GameServer::~GameServer() {
  for (AbstractPlayer* player : players_) {
    delete player;
  }
}

void GameServer::register_player(seat_index_t seat, AbstractPlayer* player) {
  if (seat < 0) {
    for (seat_index_t s = 0; s < kNumPlayers; ++s) {
      if (!players_[s]) {
        seat = s;
        break;
      }
    }
  }
  if (seat < 0 || seat >= kNumPlayers || players_[seat]) {
    std::string name = player->get_name();
    delete player;
    throw util::CleanException("Cannot register player \"{}\": seat {} unavailable", name,
                               int(seat));
  }
  players_[seat] = player;
  player_names_[seat] = player->get_name();
}

int GameServer::num_registered_players() const {
  int n = 0;
  for (AbstractPlayer* player : players_) {
    n += player != nullptr;
  }
  return n;
}

void GameServer::run() {
  CLEAN_ASSERT(num_registered_players() == kNumPlayers, "Invalid number of players registered: {}",
               num_registered_players());

  for (int g = 0; params_.num_games <= 0 || g < params_.num_games; ++g) {
    play_game();
  }
  print_summary();
}

Outcome GameServer::play_game() {
  RELEASE_ASSERT(num_registered_players() == kNumPlayers, "play_game() without {} players",
                 kNumPlayers);

  for (seat_index_t s = 0; s < kNumPlayers; ++s) {
    players_[s]->init_game(player_names_, s);
    if (!players_[s]->start_game()) {
      throw util::CleanException("Player \"{}\" declined to start game {}", player_names_[s],
                                 game_id_);
    }
  }

  Board board;
  for (action_t action : initial_actions_) {
    apply_action(board, action);
  }

  if (params_.print_game_states) {
    Game::IO::print_board(std::cout, board, -1, &player_names_);
  }

  Outcome outcome = Game::Rules::evaluate(board);
  while (!outcome.is_terminal()) {
    seat_index_t seat = mark_to_seat(Game::Rules::get_current_mark(board));
    action_t action = players_[seat]->get_move(board);
    apply_action(board, action);
    outcome = Game::Rules::evaluate(board);
  }

  for (AbstractPlayer* player : players_) {
    player->end_game(board, outcome);
  }
  scoreboard_.record(outcome);

  if (params_.announce_game_results) {
    std::stringstream ss;
    ss << fmt::format("Game {} complete: {}\n", game_id_, outcome.to_str());
    for (seat_index_t s = 0; s < kNumPlayers; ++s) {
      const char* result = outcome.kind == Outcome::kDraw          ? "draw"
                           : outcome.is_win_for(seat_to_mark(s)) ? "win"
                                                                 : "loss";
      ss << fmt::format("  seat={} name={} {}\n", int(s), player_names_[s], result);
    }
    LOG_INFO("{}", ss.str());
  }

  game_id_++;
  return outcome;
}

void GameServer::print_summary() const {
  LOG_INFO("All games complete!");
  for (seat_index_t s = 0; s < kNumPlayers; ++s) {
    LOG_INFO("seat={} name={} {}", int(s), player_names_[s], scoreboard_.get_results_str(s));
  }
}

GameServer::action_vec_t GameServer::parse_initial_actions(const std::string& str) {
  action_vec_t actions;
  if (str.empty()) return actions;

  for (const auto& action_str : util::split(str, ",")) {
    action_t action = util::atoi_safe(action_str);
    CLEAN_ASSERT(action >= 0 && action < kNumCells, "Invalid initial action: {} in {}", action_str,
                 str);
    actions.push_back(action);
  }
  return actions;
}

void GameServer::apply_action(Board& board, action_t action) {
  cell_t mark = Game::Rules::get_current_mark(board);
  Game::Rules::apply_move(board, action, mark);

  if (params_.print_game_states) {
    Game::IO::print_board(std::cout, board, action, &player_names_);
  }

  for (AbstractPlayer* player : players_) {
    player->receive_state_change(mark_to_seat(mark), board, action);
  }
}

}  // namespace ttt
