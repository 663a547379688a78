#pragma once

#include "ttt/AbstractPlayer.hpp"
#include "ttt/DecisionEngine.hpp"
#include "ttt/Game.hpp"

namespace ttt {

/*
 * Plays the move DecisionEngine::best_move() picks. Never loses.
 */
class PerfectPlayer : public AbstractPlayer {
 public:
  struct Params {
    bool verbose = false;
    int move_delay_ms = 0;  // pause before each move, so that a human can follow along

    auto make_options_description();
  };

  PerfectPlayer(const Params&);

  action_t get_move(const Board& board) override;

 private:
  static DecisionEngine::Params make_engine_params(const Params&);

  const Params params_;
  const DecisionEngine engine_;
};

}  // namespace ttt

#include "inline/ttt/players/PerfectPlayer.inl"
