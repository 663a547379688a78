#pragma once

#include "ttt/Constants.hpp"
#include "ttt/Outcome.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace ttt {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

/*
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 */
class Game {
 public:
  using cell_array_t = std::array<cell_t, kNumCells>;
  using action_vec_t = std::vector<action_t>;
  using player_name_array_t = std::array<std::string, kNumPlayers>;

  struct Rules;

  /*
   * A Board is the ordered sequence of 9 cells, stored as one occupancy mask per mark.
   *
   * A default-constructed Board is empty. The only mutation is Rules::apply_move(), so every Board
   * satisfies count(kMarkA) - count(kMarkB) in {0, 1}. Boards are small values; copy them freely.
   */
  class Board {
   public:
    Board() = default;

    /*
     * Builds a board from an explicit cell sequence. Throws PreconditionViolated if a cell is not
     * one of kEmpty/kMarkA/kMarkB, or if the mark counts violate the alternation invariant.
     */
    static Board from_cells(const cell_array_t& cells);

    auto operator<=>(const Board& other) const = default;
    size_t hash() const { return (size_t(a_mask_) << 16) + b_mask_; }

    cell_t get_cell(action_t index) const;
    cell_t get_cell(int row, int col) const { return get_cell(row * kBoardDimension + col); }
    cell_array_t to_cells() const;

    mask_t mask(cell_t mark) const { return mark == kMarkA ? a_mask_ : b_mask_; }
    mask_t full_mask() const { return a_mask_ | b_mask_; }
    int count(cell_t mark) const;

   private:
    friend struct Rules;

    mask_t a_mask_ = 0;  // cells occupied by kMarkA
    mask_t b_mask_ = 0;  // cells occupied by kMarkB
  };

  struct Rules {
    // The side to move: kMarkA when both marks have been placed equally often, else kMarkB.
    static cell_t get_current_mark(const Board&);

    /*
     * Places mark at index. Throws GameAlreadyOver if the board is terminal, and InvalidMove if
     * index is out of range, mark is not a mark, the cell is occupied, or it is not mark's turn. On
     * failure the board is left unchanged.
     */
    static void apply_move(Board&, action_t index, cell_t mark);

    static Outcome evaluate(const Board&);

    // Indices of empty cells, ascending.
    static action_vec_t empty_indices(const Board&);
  };

  struct IO {
    static std::string mark_to_str(cell_t mark);
    static void print_board(std::ostream&, const Board&, action_t last_action = -1,
                            const player_name_array_t* player_names = nullptr);
    static std::string compact_board_repr(const Board& board);

    /*
     * Parses a board such as "XX_OO____" or "X|X|_ / O|O|_ / _|_|_". Whitespace, '|' and '/' are
     * ignored; 'X' is kMarkA, 'O' is kMarkB, '_' and '.' are empty.
     *
     * Throws util::CleanException on unrecognized characters or a cell count other than 9, and
     * PreconditionViolated if the mark counts are impossible.
     */
    static Board parse_board(const std::string& str);
  };

  static constexpr mask_t kThreeInARowMasks[] = {
    make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
    make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};

  static constexpr mask_t kFullBoardMask = (mask_t(1) << kNumCells) - 1;
};

}  // namespace ttt

namespace std {

template <>
struct hash<ttt::Game::Board> {
  size_t operator()(const ttt::Game::Board& board) const { return board.hash(); }
};

}  // namespace std

#include "inline/ttt/Game.inl"
