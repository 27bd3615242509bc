#pragma once

#include "games/tictactoe/Board.hpp"
#include "games/tictactoe/Types.hpp"

#include <ostream>
#include <string>

namespace tictactoe {

struct IO {
  /*
   * Prints the board with a row/column legend. In terminal mode (see util::Rendering), each mark is
   * drawn in its player's color, and the cells of a winning line are drawn in reverse video.
   */
  static void print_board(std::ostream&, const Board& board, const Outcome& outcome);

  /*
   * One line per row, '_' for an empty cell. E.g.:
   *
   * X_O
   * _X_
   * __O
   */
  static std::string compact_board_repr(const Board& board);

  // "X's turn", "Tied game!", or "Player \"O\" won!"
  static std::string status_text(const Board& board, const Outcome& outcome);

  // The label of the first player holding mark, or mark_to_str(mark) if there is none.
  static std::string label_of(const Board& board, Mark mark);
};

}  // namespace tictactoe
