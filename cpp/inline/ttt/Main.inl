#include "ttt/Main.hpp"

#include "ttt/Exceptions.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <unistd.h>

namespace ttt {

inline auto Main::Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");
  return desc
    .add_option("player", po::value<std::vector<std::string>>(&player_strs),
                "one player, as a quoted string of player options; repeat once per player")
    .add_option("analyze-board", po::value<std::string>(&analyze_board_str),
                "score every move for the side to move on a 9-char board like \"XX_OO____\", "
                "then exit");
}

inline std::vector<std::string> Main::get_default_player_strs() {
  return {"--type=TUI --seat=0", "--type=Perfect --seat=1 --move-delay-ms=500"};
}

inline void Main::register_players(GameServer& server,
                                   PlayerFactory::player_generator_seat_vec_t& generator_seats) {
  for (bool explicit_seat : {true, false}) {
    for (auto& pgs : generator_seats) {
      if ((pgs.seat >= 0) != explicit_seat) continue;
      server.register_player(pgs.seat, pgs.generator->generate_with_name());
    }
  }
}

inline void Main::analyze_board(const std::string& board_str, const DecisionEngine::Params& params,
                                std::ostream& os) {
  using Board = Game::Board;

  Board board;
  try {
    board = Game::IO::parse_board(board_str);
  } catch (const PreconditionViolated& e) {
    throw util::CleanException("Invalid --analyze-board \"{}\": {}", board_str, e.what());
  }
  Game::IO::print_board(os, board);

  Outcome outcome = Game::Rules::evaluate(board);
  if (outcome.is_terminal()) {
    os << "Game over: " << outcome << std::endl;
    return;
  }

  cell_t mark = Game::Rules::get_current_mark(board);
  DecisionEngine engine(params);
  DecisionEngine::score_array_t scores = engine.get_move_scores(board, mark);

  os << Game::IO::mark_to_str(mark) << " to move" << std::endl;
  for (action_t a = 0; a < kNumCells; ++a) {
    if (scores[a] == DecisionEngine::kIllegalMove) continue;
    const char* label = scores[a] == DecisionEngine::kWinScore    ? "win"
                        : scores[a] == DecisionEngine::kDrawScore ? "draw"
                                                                  : "loss";
    os << "  move " << a << ": " << scores[a] << " (" << label << ")" << std::endl;
  }
  os << "Best move: " << engine.best_move(board, mark) << std::endl;
}

inline int Main::main(int ac, char* av[]) {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  Args args;
  util::Logging::Params log_params;
  GameServer::Params server_params;
  DecisionEngine::Params analysis_params;

  try {
    po2::options_description desc("General options");
    desc.add_option("help,h", "print this help, plus the options of every --player type given")
      .add(args.make_options_description())
      .add(log_params.make_options_description())
      .add(server_params.make_options_description())
      .add(analysis_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);
    PlayerFactory player_factory = PlayerFactory::make_default();

    if (vm.count("help")) {
      std::cout << desc << std::endl;
      player_factory.print_help(args.player_strs, std::cout);
      return 0;
    }

    util::Logging::init(log_params);

    if (!args.analyze_board_str.empty()) {
      analyze_board(args.analyze_board_str, analysis_params, std::cout);
      return 0;
    }

    LOG_INFO("tictactoe started (pid {})", getpid());

    GameServer server(server_params);
    auto generator_seats = player_factory.parse(
      args.player_strs.empty() ? get_default_player_strs() : args.player_strs);
    register_players(server, generator_seats);
    server.run();
    return 0;
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: " << e.what() << std::endl;
    return 1;
  }
}

}  // namespace ttt
