#include "ttt/Game.hpp"

#include "ttt/Exceptions.hpp"

#include <bit>

namespace ttt {

inline cell_t Game::Board::get_cell(action_t index) const {
  mask_t bit = mask_t(1) << index;
  if (a_mask_ & bit) return kMarkA;
  if (b_mask_ & bit) return kMarkB;
  return kEmpty;
}

inline Game::cell_array_t Game::Board::to_cells() const {
  cell_array_t cells;
  for (int i = 0; i < kNumCells; ++i) {
    cells[i] = get_cell(i);
  }
  return cells;
}

inline int Game::Board::count(cell_t mark) const { return std::popcount(mask(mark)); }

inline cell_t Game::Rules::get_current_mark(const Board& board) {
  return board.count(kMarkA) == board.count(kMarkB) ? kMarkA : kMarkB;
}

inline Outcome Game::Rules::evaluate(const Board& board) {
  for (mask_t mask : kThreeInARowMasks) {
    if ((mask & board.a_mask_) == mask) return Outcome::win(kMarkA);
    if ((mask & board.b_mask_) == mask) return Outcome::win(kMarkB);
  }

  if (board.full_mask() == kFullBoardMask) {
    return Outcome::draw();
  }
  return Outcome::in_progress();
}

inline Game::action_vec_t Game::Rules::empty_indices(const Board& board) {
  action_vec_t indices;
  uint32_t u = kFullBoardMask & ~board.full_mask();
  while (u) {
    indices.push_back(std::countr_zero(u));
    u &= u - 1;
  }
  return indices;
}

}  // namespace ttt
