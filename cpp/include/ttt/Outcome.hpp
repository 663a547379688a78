#pragma once

#include "ttt/Constants.hpp"

#include <compare>
#include <ostream>
#include <string>

namespace ttt {

/*
 * Outcome is always computed from a Board by Game::Rules::evaluate(). It is a value, never a field
 * of the Board.
 */
struct Outcome {
  enum kind_t : int8_t { kInProgress, kWin, kDraw };

  static Outcome in_progress() { return Outcome{kInProgress, kEmpty}; }
  static Outcome win(cell_t mark) { return Outcome{kWin, mark}; }
  static Outcome draw() { return Outcome{kDraw, kEmpty}; }

  bool is_terminal() const { return kind != kInProgress; }
  bool is_win_for(cell_t mark) const { return kind == kWin && winner == mark; }
  auto operator<=>(const Outcome& other) const = default;

  std::string to_str() const;
  friend std::ostream& operator<<(std::ostream& os, const Outcome& o) { return os << o.to_str(); }

  kind_t kind = kInProgress;
  cell_t winner = kEmpty;  // only meaningful for kWin
};

}  // namespace ttt
