#include "games/tictactoe/Board.hpp"

#include "util/Asserts.hpp"

namespace tictactoe {

Board::Board(int dimension, const player_vec_t& players)
    : dimension_(dimension), players_(players) {
  CLEAN_ASSERT(dimension >= 1, "Invalid board size {}", dimension);
  CLEAN_ASSERT(!players.empty(), "A board needs at least one player");
  for (const Player& player : players) {
    CLEAN_ASSERT(player.mark != Mark::kEmpty, "Player \"{}\" has the empty mark", player.label);
  }

  cells_.resize(num_cells(), Mark::kEmpty);
  winning_lines_ = make_winning_lines(dimension);
}

std::vector<Cell> Board::empty_cells() const {
  std::vector<Cell> cells;
  for (int row = 0; row < dimension_; ++row) {
    for (int col = 0; col < dimension_; ++col) {
      if (cells_[index(row, col)] == Mark::kEmpty) {
        cells.push_back(Cell{row, col});
      }
    }
  }
  return cells;
}

bool Board::is_legal(const Move& move) const {
  if (!in_range(move.row, move.col)) return false;
  if (mark_at(move.row, move.col) != Mark::kEmpty) return false;
  if (move.mark == Mark::kEmpty || !in_turn_order(move.mark)) return false;
  return !evaluate_outcome().is_terminal();
}

Mark Board::apply(const Move& move) {
  if (!in_range(move.row, move.col)) {
    throw IllegalMoveError("Cell ({}, {}) is out of range for a {}x{} board", move.row, move.col,
                           dimension_, dimension_);
  }
  if (move.mark == Mark::kEmpty) {
    throw IllegalMoveError("Cannot place the empty mark at ({}, {})", move.row, move.col);
  }
  Mark occupant = mark_at(move.row, move.col);
  if (occupant != Mark::kEmpty) {
    throw IllegalMoveError("Cell ({}, {}) is already taken by {}", move.row, move.col,
                           mark_to_str(occupant));
  }
  if (!in_turn_order(move.mark)) {
    throw IllegalMoveError("{} cannot move with {} X and {} O on the board", mark_to_str(move.mark),
                           num_marks(Mark::kX), num_marks(Mark::kO));
  }
  if (evaluate_outcome().is_terminal()) {
    throw IllegalMoveError("The game is over");
  }

  cells_[index(move.row, move.col)] = move.mark;
  return move.mark;
}

Outcome Board::evaluate_outcome() const {
  for (const WinningLine& line : winning_lines_) {
    Mark first = mark_at(line[0]);
    if (first == Mark::kEmpty) continue;

    bool complete = true;
    for (const Cell& cell : line) {
      if (mark_at(cell) != first) {
        complete = false;
        break;
      }
    }
    if (complete) {
      return Outcome::win(first, line);
    }
  }

  if (num_empty_cells() == 0) {
    return Outcome::tie();
  }
  return Outcome::in_progress();
}

std::vector<WinningLine> Board::make_winning_lines(int dimension) {
  std::vector<WinningLine> lines;
  lines.reserve(2 * dimension + 2);

  for (int row = 0; row < dimension; ++row) {
    WinningLine line;
    for (int col = 0; col < dimension; ++col) {
      line.push_back(Cell{row, col});
    }
    lines.push_back(line);
  }

  for (int col = 0; col < dimension; ++col) {
    WinningLine line;
    for (int row = 0; row < dimension; ++row) {
      line.push_back(Cell{row, col});
    }
    lines.push_back(line);
  }

  WinningLine main_diag;
  WinningLine anti_diag;
  for (int i = 0; i < dimension; ++i) {
    main_diag.push_back(Cell{i, i});
    anti_diag.push_back(Cell{i, dimension - 1 - i});
  }
  lines.push_back(main_diag);
  lines.push_back(anti_diag);

  return lines;
}

}  // namespace tictactoe
