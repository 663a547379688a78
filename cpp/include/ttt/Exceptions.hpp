#pragma once

#include "util/Exception.hpp"

namespace ttt {

/*
 * The three errors raised by the game core. All of them indicate a caller error: the core never
 * retries or degrades, and a call that throws leaves its Board argument unchanged.
 */

// Occupied cell, index out of range, not a mark, or move submitted out of turn.
class InvalidMove : public util::Exception {
 public:
  using util::Exception::Exception;
};

// Mutation attempted on a board that already has a winner or is full.
class GameAlreadyOver : public util::Exception {
 public:
  using util::Exception::Exception;
};

// Search requested on a terminal board or for the side not to move, or a malformed board.
class PreconditionViolated : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace ttt
