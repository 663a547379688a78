#include "ttt/Constants.hpp"
#include "ttt/DecisionEngine.hpp"
#include "ttt/Exceptions.hpp"
#include "ttt/Game.hpp"
#include "ttt/Outcome.hpp"
#include "util/GTestUtil.hpp"

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

using namespace ttt;

using Board = Game::Board;
using Rules = Game::Rules;

namespace {

const cell_t A = kMarkA;
const cell_t B = kMarkB;
const cell_t _ = kEmpty;

// Copies whatever the default logger emits while in scope.
class LogCapture {
 public:
  LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(ss_)) {
    sink_->set_pattern("%v");
    spdlog::default_logger()->sinks().push_back(sink_);
  }

  ~LogCapture() {
    auto& sinks = spdlog::default_logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
  }

  std::string str() const { return ss_.str(); }

 private:
  std::ostringstream ss_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

}  // namespace

class DecisionEngineTest : public testing::Test {
 protected:
  /*
   * Game value from the perspective of the side to move (+1 win, 0 draw, -1 loss), computed by
   * memoized negamax. Kept separate from DecisionEngine::score() so that the two can be checked
   * against each other.
   */
  int negamax(const Board& board) {
    auto it = cache_.find(board);
    if (it != cache_.end()) return it->second;

    int value;
    Outcome outcome = Rules::evaluate(board);
    if (outcome.kind == Outcome::kWin) {
      value = -1;  // the previous mover completed a line
    } else if (outcome.kind == Outcome::kDraw) {
      value = 0;
    } else {
      value = -1;
      cell_t mark = Rules::get_current_mark(board);
      for (action_t a : Rules::empty_indices(board)) {
        Board child = board;
        Rules::apply_move(child, a, mark);
        value = std::max(value, -negamax(child));
      }
    }
    cache_[board] = value;
    return value;
  }

  std::vector<Board> reachable_nonterminal_boards() {
    std::vector<Board> out;
    std::unordered_map<Board, bool> seen;
    std::vector<Board> stack = {Board()};
    while (!stack.empty()) {
      Board board = stack.back();
      stack.pop_back();
      if (seen.count(board)) continue;
      seen[board] = true;
      if (Rules::evaluate(board).is_terminal()) continue;
      out.push_back(board);
      cell_t mark = Rules::get_current_mark(board);
      for (action_t a : Rules::empty_indices(board)) {
        Board child = board;
        Rules::apply_move(child, a, mark);
        stack.push_back(child);
      }
    }
    return out;
  }

  /*
   * Plays engine (as engine_mark) against every possible sequence of opponent replies, returning
   * false if any line ends in a loss for engine_mark.
   */
  bool never_loses(const Board& board, cell_t engine_mark) {
    Outcome outcome = Rules::evaluate(board);
    if (outcome.is_terminal()) {
      return !outcome.is_win_for(opponent_of(engine_mark));
    }

    cell_t mark = Rules::get_current_mark(board);
    if (mark == engine_mark) {
      Board child = board;
      Rules::apply_move(child, engine_.best_move(board, mark), mark);
      return never_loses(child, engine_mark);
    }

    for (action_t a : Rules::empty_indices(board)) {
      Board child = board;
      Rules::apply_move(child, a, mark);
      if (!never_loses(child, engine_mark)) return false;
    }
    return true;
  }

  DecisionEngine engine_;
  std::unordered_map<Board, int> cache_;
};

TEST_F(DecisionEngineTest, empty_board_tie_break) {
  Board board;
  EXPECT_EQ(engine_.best_move(board, kMarkA), 0);
  EXPECT_EQ(engine_.best_move(board, kMarkA), 0);

  // Every opening is a draw with perfect play.
  DecisionEngine::score_array_t scores = engine_.get_move_scores(board, kMarkA);
  for (action_t a = 0; a < kNumCells; ++a) {
    EXPECT_EQ(scores[a], DecisionEngine::kDrawScore) << "move " << a;
  }
}

TEST_F(DecisionEngineTest, completes_own_line) {
  Board board = Board::from_cells({A, A, _, B, B, _, _, _, _});
  EXPECT_EQ(engine_.best_move(board, kMarkA), 2);

  Board after = board;
  Rules::apply_move(after, 2, kMarkA);
  EXPECT_EQ(Rules::evaluate(after), Outcome::win(kMarkA));
}

TEST_F(DecisionEngineTest, completes_diagonal) {
  // Equal mark counts, so A is to move. Both 6 and 8 complete a line for A.
  Board board = Board::from_cells({A, B, A, B, A, B, _, _, _});
  EXPECT_EQ(Rules::get_current_mark(board), kMarkA);
  EXPECT_EQ(engine_.best_move(board, kMarkA), 6);
  EXPECT_THROW(engine_.best_move(board, kMarkB), PreconditionViolated);
}

TEST_F(DecisionEngineTest, blocks_opponent_line) {
  EXPECT_EQ(engine_.best_move(Board::from_cells({A, A, _, _, B, _, _, _, _}), kMarkB), 2);
  EXPECT_EQ(engine_.best_move(Board::from_cells({_, _, _, _, B, _, _, A, A}), kMarkB), 6);
}

TEST_F(DecisionEngineTest, takes_center_against_corner) {
  Board board = Board::from_cells({A, _, _, _, _, _, _, _, _});
  EXPECT_EQ(engine_.best_move(board, kMarkB), 4);

  DecisionEngine::score_array_t scores = engine_.get_move_scores(board, kMarkB);
  EXPECT_EQ(scores[0], DecisionEngine::kIllegalMove);
  EXPECT_EQ(scores[4], DecisionEngine::kDrawScore);
  for (action_t a : {1, 2, 3, 5, 6, 7, 8}) {
    EXPECT_EQ(scores[a], DecisionEngine::kLossScore) << "move " << a;
  }
}

TEST_F(DecisionEngineTest, lowest_index_among_equals) {
  // Playing 8 wins at once, but 2 also forces a win (double threat on 6 and 8) and has the lower
  // index. Wins are not discounted by depth.
  Board board = Board::from_cells({A, B, _, B, A, _, _, _, _});
  Board b2 = board;
  Rules::apply_move(b2, 8, kMarkA);
  EXPECT_EQ(Rules::evaluate(b2), Outcome::win(kMarkA));

  DecisionEngine::score_array_t scores = engine_.get_move_scores(board, kMarkA);
  action_t first_best = -1;
  for (action_t a = 0; a < kNumCells; ++a) {
    if (scores[a] == DecisionEngine::kWinScore) {
      first_best = a;
      break;
    }
  }
  EXPECT_EQ(engine_.best_move(board, kMarkA), first_best);
  EXPECT_EQ(first_best, 2);
}

TEST_F(DecisionEngineTest, does_not_mutate_board) {
  Board board = Board::from_cells({A, _, _, _, B, _, _, _, _});
  Board before = board;
  engine_.best_move(board, kMarkA);
  engine_.get_move_scores(board, kMarkA);
  EXPECT_EQ(board, before);
}

TEST_F(DecisionEngineTest, preconditions) {
  Board won = Board::from_cells({A, A, A, B, B, _, _, _, _});
  EXPECT_THROW(engine_.best_move(won, kMarkB), PreconditionViolated);

  Board drawn = Board::from_cells({A, B, A, A, B, B, B, A, A});
  EXPECT_THROW(engine_.best_move(drawn, kMarkB), PreconditionViolated);

  EXPECT_THROW(engine_.best_move(Board(), kMarkB), PreconditionViolated);
  EXPECT_THROW(engine_.best_move(Board(), kEmpty), PreconditionViolated);
}

TEST_F(DecisionEngineTest, score_of_terminal_boards) {
  Board won = Board::from_cells({A, A, A, B, B, _, _, _, _});
  EXPECT_EQ(DecisionEngine::score(won, kMarkA), DecisionEngine::kWinScore);
  EXPECT_EQ(DecisionEngine::score(won, kMarkB), DecisionEngine::kLossScore);

  Board drawn = Board::from_cells({A, B, A, A, B, B, B, A, A});
  EXPECT_EQ(DecisionEngine::score(drawn, kMarkA), DecisionEngine::kDrawScore);
}

TEST_F(DecisionEngineTest, optimal_on_every_reachable_board) {
  for (const Board& board : reachable_nonterminal_boards()) {
    cell_t mark = Rules::get_current_mark(board);
    action_t move = engine_.best_move(board, mark);
    ASSERT_EQ(board.get_cell(move), kEmpty) << Game::IO::compact_board_repr(board);

    Board child = board;
    Rules::apply_move(child, move, mark);
    EXPECT_EQ(-negamax(child), negamax(board)) << Game::IO::compact_board_repr(board);

    // No lower index achieves the same value.
    for (action_t a : Rules::empty_indices(board)) {
      if (a >= move) break;
      Board other = board;
      Rules::apply_move(other, a, mark);
      EXPECT_LT(-negamax(other), negamax(board)) << Game::IO::compact_board_repr(board);
    }
  }
}

TEST_F(DecisionEngineTest, first_player_never_loses) {
  EXPECT_TRUE(never_loses(Board(), kMarkA));
}

TEST_F(DecisionEngineTest, second_player_never_loses) {
  EXPECT_TRUE(never_loses(Board(), kMarkB));
}

TEST_F(DecisionEngineTest, self_play_draws) {
  Board board;
  while (!Rules::evaluate(board).is_terminal()) {
    cell_t mark = Rules::get_current_mark(board);
    Rules::apply_move(board, engine_.best_move(board, mark), mark);
  }
  EXPECT_EQ(Rules::evaluate(board), Outcome::draw());
  EXPECT_EQ(Game::IO::compact_board_repr(board), "XXO\nOOX\nXOX");
}

TEST(DecisionEngine, verbose_logs_move_scores) {
  Board board = Board::from_cells({A, A, _, B, B, _, _, _, _});
  DecisionEngine::Params params;
  params.verbose = true;

  LogCapture capture;
  EXPECT_EQ(DecisionEngine(params).best_move(board, kMarkA), 2);
  std::string log = capture.str();

  EXPECT_NE(log.find("X to move on\nXX_\nOO_\n___"), std::string::npos) << log;
  EXPECT_NE(log.find("  move 2: score 1\n"), std::string::npos) << log;
  for (action_t a : Rules::empty_indices(board)) {
    EXPECT_NE(log.find(fmt::format("  move {}: score ", a)), std::string::npos) << log;
  }
  EXPECT_EQ(log.find("  move 0: "), std::string::npos) << log;
  EXPECT_NE(log.find("X plays 2 (score 1)"), std::string::npos) << log;
}

TEST(DecisionEngine, quiet_by_default) {
  LogCapture capture;
  EXPECT_EQ(DecisionEngine().best_move(Board::from_cells({A, A, _, B, B, _, _, _, _}), kMarkA), 2);
  EXPECT_EQ(capture.str(), "");
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
