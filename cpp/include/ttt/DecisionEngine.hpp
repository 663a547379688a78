#pragma once

#include "ttt/Constants.hpp"
#include "ttt/Game.hpp"

#include <array>

namespace ttt {

/*
 * DecisionEngine computes the game-theoretically optimal move via full-depth minimax.
 *
 * The search recurses to terminal boards, scoring +1 for a win of the maximizing mark, -1 for a
 * loss and 0 for a draw. Which side minimizes or maximizes at each level is derived from the board
 * itself (Game::Rules::get_current_mark()), never carried as a separate flag. There is no pruning
 * and no memoization.
 *
 * Among equally-scored root moves, the lowest index wins, so play is fully deterministic.
 *
 * The engine never mutates the caller's board: every hypothetical move is applied to a copy.
 */
class DecisionEngine {
 public:
  using Board = Game::Board;
  using score_t = int;
  using score_array_t = std::array<score_t, kNumCells>;

  static constexpr score_t kWinScore = 1;
  static constexpr score_t kDrawScore = 0;
  static constexpr score_t kLossScore = -1;
  static constexpr score_t kIllegalMove = -2;  // get_move_scores() entry for occupied cells

  struct Params {
    bool verbose = false;  // log per-move scores of every root search

    auto make_options_description();
  };

  DecisionEngine() {}
  explicit DecisionEngine(const Params& params) : params_(params) {}

  /*
   * Returns the optimal index for mark. Throws PreconditionViolated if the board is terminal or if
   * it is not mark's turn.
   */
  action_t best_move(const Board& board, cell_t mark) const;

  /*
   * The score of each legal root move from mark's perspective, kIllegalMove for occupied cells.
   * Same preconditions as best_move().
   */
  score_array_t get_move_scores(const Board& board, cell_t mark) const;

  // Minimax value of board from maximizing_mark's perspective.
  static score_t score(const Board& board, cell_t maximizing_mark);

 private:
  static void validate(const Board& board, cell_t mark);

  const Params params_;
};

}  // namespace ttt

#include "inline/ttt/DecisionEngine.inl"
