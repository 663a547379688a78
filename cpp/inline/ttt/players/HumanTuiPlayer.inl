#include "ttt/players/HumanTuiPlayer.hpp"

#include "ttt/Exceptions.hpp"
#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"
#include "util/StringUtil.hpp"

#include <string>

namespace ttt {

inline bool HumanTuiPlayer::start_game() {
  last_action_ = -1;
  return true;
}

inline void HumanTuiPlayer::receive_state_change(seat_index_t, const Board&, action_t action) {
  last_action_ = action;
}

inline action_t HumanTuiPlayer::get_move(const Board& board) {
  maybe_clear_screen();
  print_board(board);

  bool complain = false;
  while (true) {
    if (complain) {
      out_ << "Invalid input!" << std::endl;
    }
    complain = true;
    action_t action = prompt_for_move();
    if (action < 0) continue;

    Board copy = board;
    try {
      Game::Rules::apply_move(copy, action, get_my_mark());
    } catch (const InvalidMove&) {
      continue;
    }
    return action;
  }
}

inline void HumanTuiPlayer::end_game(const Board& board, const Outcome& outcome) {
  maybe_clear_screen();
  print_board(board);

  if (outcome.is_win_for(get_my_mark())) {
    out_ << "Congratulations, you win!" << std::endl;
  } else if (outcome.kind == Outcome::kWin) {
    out_ << "Sorry, you lose." << std::endl;
  } else {
    out_ << "The game has ended in a draw." << std::endl;
  }
}

inline action_t HumanTuiPlayer::prompt_for_move() {
  out_ << "Enter move [0-" << kNumCells - 1 << "]: ";
  out_.flush();
  std::string input;
  if (!std::getline(in_, input)) {
    throw util::CleanException("{}: end of input", get_name());
  }
  try {
    return util::atoi_safe(input);
  } catch (const util::CleanException&) {
    return -1;
  }
}

inline void HumanTuiPlayer::print_board(const Board& board) {
  Game::IO::print_board(out_, board, last_action_, &get_player_names());
}

inline void HumanTuiPlayer::maybe_clear_screen() {
  if (clear_screen_) util::clearscreen();
}

}  // namespace ttt
