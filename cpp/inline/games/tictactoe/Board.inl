#include "games/tictactoe/Board.hpp"

#include "util/Asserts.hpp"

#include <algorithm>

namespace tictactoe {

inline Board::ScopedMove::ScopedMove(Board& board, const Cell& cell, Mark mark)
    : board_(board), cell_(cell) {
  DEBUG_ASSERT(mark != Mark::kEmpty);
  DEBUG_ASSERT(board.in_range(cell.row, cell.col));
  DEBUG_ASSERT(board.mark_at(cell) == Mark::kEmpty, "cell ({}, {}) is occupied", cell.row,
               cell.col);
  board_.cells_[board_.index(cell_.row, cell_.col)] = mark;
}

inline Board::ScopedMove::~ScopedMove() {
  board_.cells_[board_.index(cell_.row, cell_.col)] = Mark::kEmpty;
}

inline bool Board::in_range(int row, int col) const {
  return row >= 0 && row < dimension_ && col >= 0 && col < dimension_;
}

inline Mark Board::mark_at(int row, int col) const {
  DEBUG_ASSERT(in_range(row, col), "({}, {}) out of range", row, col);
  return cells_[index(row, col)];
}

inline int Board::num_empty_cells() const {
  return std::count(cells_.begin(), cells_.end(), Mark::kEmpty);
}

inline int Board::num_marks(Mark mark) const {
  return std::count(cells_.begin(), cells_.end(), mark);
}

inline bool Board::in_turn_order(Mark mark) const {
  int lead = num_marks(Mark::kX) - num_marks(Mark::kO);
  return mark == Mark::kX ? lead == 0 : lead == 1;
}

inline void Board::reset() { std::fill(cells_.begin(), cells_.end(), Mark::kEmpty); }

inline void Board::toggle_turn() { turn_index_ = (turn_index_ + 1) % players_.size(); }

}  // namespace tictactoe
