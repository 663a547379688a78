#include "ttt/Scoreboard.hpp"

#include "util/Asserts.hpp"

#include <fmt/format.h>

namespace ttt {

inline void Scoreboard::record(const Outcome& outcome) {
  RELEASE_ASSERT(outcome.is_terminal(), "Cannot record a game in progress");

  for (seat_index_t s = 0; s < kNumPlayers; ++s) {
    if (outcome.kind == Outcome::kDraw) {
      records_[s].draw++;
    } else if (outcome.is_win_for(seat_to_mark(s))) {
      records_[s].win++;
    } else {
      records_[s].loss++;
    }
  }
  num_games_++;
}

inline std::string Scoreboard::get_results_str(seat_index_t seat) const {
  const Record& r = records_[seat];
  return fmt::format("W{} L{} D{}", r.win, r.loss, r.draw);
}

}  // namespace ttt
