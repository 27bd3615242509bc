#pragma once

#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Types.hpp"

#include <vector>

namespace tictactoe {

/*
 * An N x N grid of marks, together with the ordered list of players and a cursor into that list
 * indicating whose turn it is.
 *
 * The winning-line set (N rows, N columns, and the 2 diagonals) is computed once at construction
 * and never changes, including across reset().
 *
 * Cell (row, col) is stored at index row * N + col:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 */
class Board {
 public:
  /*
   * Provisionally places a mark on an empty cell, and restores the cell to Mark::kEmpty when the
   * ScopedMove goes out of scope, whether by return, break, or exception.
   *
   * The turn cursor is not touched.
   */
  class ScopedMove {
   public:
    ScopedMove(Board& board, const Cell& cell, Mark mark);
    ~ScopedMove();

    ScopedMove(const ScopedMove&) = delete;
    ScopedMove& operator=(const ScopedMove&) = delete;

   private:
    Board& board_;
    const Cell cell_;
  };

  // Throws util::CleanException if dimension < 1, players is empty, or a player has the empty mark.
  Board(int dimension = kDefaultBoardDimension, const player_vec_t& players = default_players());

  bool operator==(const Board&) const = default;

  int size() const { return dimension_; }
  int num_cells() const { return dimension_ * dimension_; }
  bool in_range(int row, int col) const;
  Mark mark_at(int row, int col) const;
  Mark mark_at(const Cell& cell) const { return mark_at(cell.row, cell.col); }
  int num_empty_cells() const;
  int num_marks(Mark mark) const;

  // Empty cells in row-major order.
  std::vector<Cell> empty_cells() const;

  // Rows top to bottom, columns left to right, main diagonal, anti-diagonal.
  const std::vector<WinningLine>& winning_lines() const { return winning_lines_; }

  bool is_legal(const Move& move) const;

  /*
   * Places move.mark at (move.row, move.col) and returns move.mark.
   *
   * Throws IllegalMoveError, leaving the board unchanged, if the coordinates are out of range, the
   * mark is empty, the cell is occupied, the mark is out of turn, or the game is already over. X
   * moves first: X may not move while it leads O, and O may not move while the counts are equal.
   *
   * Does not advance the turn.
   */
  Mark apply(const Move& move);

  Outcome evaluate_outcome() const;
  bool has_winner() const { return evaluate_outcome().kind == Outcome::kWin; }
  bool is_tied() const { return evaluate_outcome().kind == Outcome::kTie; }

  // Empties every cell. Does not touch the turn cursor.
  void reset();

  const player_vec_t& players() const { return players_; }
  const Player& current_player() const { return players_[turn_index_]; }
  int turn_index() const { return turn_index_; }
  void toggle_turn();
  void reset_turn() { turn_index_ = 0; }

 private:
  static std::vector<WinningLine> make_winning_lines(int dimension);
  int index(int row, int col) const { return row * dimension_ + col; }
  bool in_turn_order(Mark mark) const;

  int dimension_;
  std::vector<Mark> cells_;
  std::vector<WinningLine> winning_lines_;
  player_vec_t players_;
  int turn_index_ = 0;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/Board.inl"
