#include "ttt/GameServer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace ttt {

inline auto GameServer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("GameServer options");
  return desc
    .add_option("num-games,G", po::value<int>(&num_games)->default_value(num_games),
                "games to play; zero or less keeps playing until interrupted")
    .add_option("initial-actions",
                po::value<std::string>(&initial_actions_str)->default_value(initial_actions_str),
                "comma-separated cells played at the start of every game, e.g. \"4,0\"")
    .add_flag("print-game-states", "do-not-print-game-states", &print_game_states,
              "print the board after every move", "do not print the board after every move")
    .add_flag("announce-game-results", "do-not-announce-game-results", &announce_game_results,
              "log the outcome of each game", "do not log the outcome of each game");
}

}  // namespace ttt
