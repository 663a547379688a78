#pragma once

#include <cstdint>

namespace ttt {

using mask_t = uint16_t;
using cell_t = int8_t;
using action_t = int32_t;
using seat_index_t = int8_t;

const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kNumPlayers = 2;
const int kMaxNameLength = 32;

const cell_t kEmpty = 0;
const cell_t kMarkA = 1;  // always moves first
const cell_t kMarkB = 2;

// Seat 0 plays kMarkA, seat 1 plays kMarkB.
inline cell_t seat_to_mark(seat_index_t seat) { return seat == 0 ? kMarkA : kMarkB; }
inline seat_index_t mark_to_seat(cell_t mark) { return mark == kMarkA ? 0 : 1; }
inline cell_t opponent_of(cell_t mark) { return mark == kMarkA ? kMarkB : kMarkA; }
inline bool is_mark(cell_t c) { return c == kMarkA || c == kMarkB; }

}  // namespace ttt
