#include "ttt/Game.hpp"

#include "ttt/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <cctype>
#include <iterator>

namespace ttt {

std::string Outcome::to_str() const {
  switch (kind) {
    case kInProgress:
      return "InProgress";
    case kWin:
      return "Win(" + Game::IO::mark_to_str(winner) + ")";
    case kDraw:
      return "Draw";
  }
  throw util::Exception("Unknown outcome kind: {}", int(kind));
}

Game::Board Game::Board::from_cells(const cell_array_t& cells) {
  Board board;
  for (int i = 0; i < kNumCells; ++i) {
    mask_t bit = mask_t(1) << i;
    switch (cells[i]) {
      case kEmpty:
        break;
      case kMarkA:
        board.a_mask_ |= bit;
        break;
      case kMarkB:
        board.b_mask_ |= bit;
        break;
      default:
        throw PreconditionViolated("Invalid cell value {} at index {}", int(cells[i]), i);
    }
  }

  int diff = board.count(kMarkA) - board.count(kMarkB);
  if (diff != 0 && diff != 1) {
    throw PreconditionViolated("Malformed board: {} X's and {} O's", board.count(kMarkA),
                               board.count(kMarkB));
  }
  return board;
}

void Game::Rules::apply_move(Board& board, action_t index, cell_t mark) {
  Outcome outcome = evaluate(board);
  if (outcome.is_terminal()) {
    throw GameAlreadyOver("Cannot play {} at {}: game is already over ({})", IO::mark_to_str(mark),
                          index, outcome.to_str());
  }
  if (index < 0 || index >= kNumCells) {
    throw InvalidMove("Index {} out of range [0, {}]", index, kNumCells - 1);
  }
  if (!is_mark(mark)) {
    throw InvalidMove("Invalid mark {}", int(mark));
  }
  if (board.get_cell(index) != kEmpty) {
    throw InvalidMove("Cell {} is already occupied by {}", index,
                      IO::mark_to_str(board.get_cell(index)));
  }
  cell_t current = get_current_mark(board);
  if (mark != current) {
    throw InvalidMove("Out of turn: {} tried to move, but it is {}'s turn", IO::mark_to_str(mark),
                      IO::mark_to_str(current));
  }

  mask_t piece_mask = mask_t(1) << index;
  if (mark == kMarkA) {
    board.a_mask_ |= piece_mask;
  } else {
    board.b_mask_ |= piece_mask;
  }
  DEBUG_ASSERT(board.count(kMarkA) - board.count(kMarkB) == 0 ||
               board.count(kMarkA) - board.count(kMarkB) == 1);
}

std::string Game::IO::mark_to_str(cell_t mark) {
  switch (mark) {
    case kMarkA:
      return "X";
    case kMarkB:
      return "O";
    default:
      return "_";
  }
}

void Game::IO::print_board(std::ostream& ss, const Board& board, action_t last_action,
                           const player_name_array_t* player_names) {
  auto glyph = [&](int i) {
    cell_t c = board.get_cell(i);
    return is_mark(c) ? mark_to_str(c) : std::string(" ");
  };

  std::string out;
  auto it = std::back_inserter(out);
  for (int i = 0; i < kNumCells; i += kBoardDimension) {
    fmt::format_to(it, "{} {} {}  |{}|{}|{}|\n", i, i + 1, i + 2, glyph(i), glyph(i + 1),
                   glyph(i + 2));
  }
  out += '\n';

  if (last_action >= 0) {
    fmt::format_to(it, "Last move: {}\n", last_action);
  }
  if (player_names) {
    fmt::format_to(it, "{}: {}\n", mark_to_str(kMarkA), (*player_names)[0]);
    fmt::format_to(it, "{}: {}\n\n", mark_to_str(kMarkB), (*player_names)[1]);
  }

  ss << out << std::endl;
}

std::string Game::IO::compact_board_repr(const Board& board) {
  char buf[12];

  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      buf[row * 4 + col] = mark_to_str(board.get_cell(row, col))[0];
    }
  }
  buf[3] = '\n';
  buf[7] = '\n';
  buf[11] = '\0';

  return std::string(buf);
}

Game::Board Game::IO::parse_board(const std::string& str) {
  cell_array_t cells;
  int n = 0;
  for (char c : str) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '|' || c == '/') continue;

    cell_t cell;
    switch (std::toupper(static_cast<unsigned char>(c))) {
      case 'X':
        cell = kMarkA;
        break;
      case 'O':
        cell = kMarkB;
        break;
      case '_':
      case '.':
        cell = kEmpty;
        break;
      default:
        throw util::CleanException("Invalid character '{}' in board \"{}\"", c, str);
    }
    if (n >= kNumCells) {
      throw util::CleanException("Too many cells in board \"{}\"", str);
    }
    cells[n++] = cell;
  }
  if (n != kNumCells) {
    throw util::CleanException("Board \"{}\" has {} cells, expected {}", str, n, kNumCells);
  }
  return Board::from_cells(cells);
}

}  // namespace ttt
