#include "ttt/players/PerfectPlayer.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <thread>

namespace ttt {

inline auto PerfectPlayer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("PerfectPlayer options");
  return desc
    .add_option("verbose,v", po::bool_switch(&verbose)->default_value(verbose),
                "log the score of every legal move")
    .add_option("move-delay-ms,d", po::value<int>(&move_delay_ms)->default_value(move_delay_ms),
                "pause this long before answering each move");
}

inline PerfectPlayer::PerfectPlayer(const Params& params)
    : params_(params), engine_(make_engine_params(params)) {
  CLEAN_ASSERT(params_.move_delay_ms >= 0, "move-delay-ms must be non-negative (got {})",
               params_.move_delay_ms);
}

inline action_t PerfectPlayer::get_move(const Board& board) {
  if (params_.move_delay_ms > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(params_.move_delay_ms));
  }
  return engine_.best_move(board, get_my_mark());
}

inline DecisionEngine::Params PerfectPlayer::make_engine_params(const Params& params) {
  DecisionEngine::Params engine_params;
  engine_params.verbose = params.verbose;
  return engine_params;
}

}  // namespace ttt
