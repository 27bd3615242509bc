#pragma once

#include "games/tictactoe/Constants.hpp"
#include "util/Exceptions.hpp"

#include <compare>
#include <cstdint>
#include <string>
#include <vector>

namespace tictactoe {

enum class Mark : int8_t { kEmpty, kX, kO };

// "X", "O", or "-" for the empty mark.
const char* mark_to_str(Mark mark);
Mark opponent(Mark mark);

struct Cell {
  auto operator<=>(const Cell&) const = default;

  int row;
  int col;
};

struct Move {
  bool operator==(const Move&) const = default;
  Cell cell() const { return Cell{row, col}; }

  int row;
  int col;
  Mark mark;
};

using WinningLine = std::vector<Cell>;

/*
 * Result of scanning a board. Always derived from the board contents, never stored alongside them.
 *
 * For kWin, winner is the mark that fills every cell of line. For kInProgress and kTie, winner is
 * Mark::kEmpty and line is empty.
 */
struct Outcome {
  enum Kind : int8_t { kInProgress, kWin, kTie };

  static Outcome in_progress() { return Outcome{kInProgress, Mark::kEmpty, {}}; }
  static Outcome win(Mark winner, const WinningLine& line) { return Outcome{kWin, winner, line}; }
  static Outcome tie() { return Outcome{kTie, Mark::kEmpty, {}}; }

  bool operator==(const Outcome&) const = default;
  bool is_terminal() const { return kind != kInProgress; }

  Kind kind;
  Mark winner;
  WinningLine line;
};

/*
 * Player identity. label and color are purely presentational; the engine only looks at mark.
 */
struct Player {
  bool operator==(const Player&) const = default;

  std::string label;
  std::string color;
  Mark mark;
};

using player_vec_t = std::vector<Player>;

player_vec_t default_players();

/*
 * Raised when a move targets an occupied or out-of-range cell, carries the Empty mark, comes from
 * the wrong player, or arrives after the game has ended. The board is left unchanged.
 */
class IllegalMoveError : public util::CleanException {
 public:
  using util::CleanException::CleanException;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/Types.inl"
