#include "ttt/DecisionEngine.hpp"

#include "ttt/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace ttt {

action_t DecisionEngine::best_move(const Board& board, cell_t mark) const {
  score_array_t scores = get_move_scores(board, mark);

  action_t best = -1;
  score_t best_score = kIllegalMove;
  for (action_t a = 0; a < kNumCells; ++a) {
    if (scores[a] > best_score) {  // strict: ties keep the lower index
      best_score = scores[a];
      best = a;
    }
  }

  if (params_.verbose) {
    LOG_INFO("DecisionEngine: {} plays {} (score {})", Game::IO::mark_to_str(mark), best,
             best_score);
  }
  return best;
}

DecisionEngine::score_array_t DecisionEngine::get_move_scores(const Board& board,
                                                              cell_t mark) const {
  validate(board, mark);

  score_array_t scores;
  scores.fill(kIllegalMove);
  for (action_t a : Game::Rules::empty_indices(board)) {
    Board child = board;
    Game::Rules::apply_move(child, a, mark);
    scores[a] = score(child, mark);
  }

  if (params_.verbose) {
    LOG_INFO("DecisionEngine: {} to move on\n{}", Game::IO::mark_to_str(mark),
             Game::IO::compact_board_repr(board));
    for (action_t a = 0; a < kNumCells; ++a) {
      if (scores[a] == kIllegalMove) continue;
      LOG_INFO("  move {}: score {}", a, scores[a]);
    }
  }
  return scores;
}

DecisionEngine::score_t DecisionEngine::score(const Board& board, cell_t maximizing_mark) {
  Outcome outcome = Game::Rules::evaluate(board);
  if (outcome.is_terminal()) {
    if (outcome.kind == Outcome::kDraw) return kDrawScore;
    return outcome.winner == maximizing_mark ? kWinScore : kLossScore;
  }

  cell_t mover = Game::Rules::get_current_mark(board);
  bool maximizing = mover == maximizing_mark;

  score_t best = maximizing ? kLossScore : kWinScore;
  for (action_t a : Game::Rules::empty_indices(board)) {
    Board child = board;
    Game::Rules::apply_move(child, a, mover);
    score_t s = score(child, maximizing_mark);
    best = maximizing ? std::max(best, s) : std::min(best, s);
  }
  return best;
}

void DecisionEngine::validate(const Board& board, cell_t mark) {
  if (!is_mark(mark)) {
    throw PreconditionViolated("Invalid mark {}", int(mark));
  }
  Outcome outcome = Game::Rules::evaluate(board);
  if (outcome.is_terminal()) {
    throw PreconditionViolated("Cannot search a finished game ({}):\n{}", outcome.to_str(),
                               Game::IO::compact_board_repr(board));
  }
  cell_t current = Game::Rules::get_current_mark(board);
  if (mark != current) {
    throw PreconditionViolated("Search requested for {}, but it is {}'s turn",
                               Game::IO::mark_to_str(mark), Game::IO::mark_to_str(current));
  }
}

}  // namespace ttt
