#pragma once

#include "ttt/Constants.hpp"
#include "ttt/Outcome.hpp"

#include <array>
#include <string>

namespace ttt {

/*
 * Win/loss/draw tallies per seat, accumulated across rounds. Lives in the driver; the game core has
 * no notion of it.
 */
class Scoreboard {
 public:
  struct Record {
    int win = 0;
    int loss = 0;
    int draw = 0;

    int total() const { return win + loss + draw; }
    auto operator<=>(const Record&) const = default;
  };

  // outcome must be terminal.
  void record(const Outcome& outcome);

  const Record& get(seat_index_t seat) const { return records_[seat]; }
  int num_games() const { return num_games_; }

  // "W{} L{} D{}"
  std::string get_results_str(seat_index_t seat) const;

 private:
  std::array<Record, kNumPlayers> records_;
  int num_games_ = 0;
};

}  // namespace ttt

#include "inline/ttt/Scoreboard.inl"
