#include "games/tictactoe/IO.hpp"

#include "util/AnsiCodes.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <sstream>

namespace tictactoe {

void IO::print_board(std::ostream& ss, const Board& board, const Outcome& outcome) {
  int n = board.size();

  std::ostringstream text;
  text << "  ";
  for (int col = 0; col < n; ++col) {
    text << ' ' << col;
  }
  text << '\n';

  for (int row = 0; row < n; ++row) {
    text << fmt::format("{:>2}|", row);
    for (int col = 0; col < n; ++col) {
      Cell cell{row, col};
      Mark mark = board.mark_at(cell);
      const WinningLine& line = outcome.line;
      bool highlight = std::find(line.begin(), line.end(), cell) != line.end();

      if (highlight) text << ansi::kReverse();
      if (mark == Mark::kEmpty) {
        text << ' ';
      } else {
        std::string color = "black";
        for (const Player& player : board.players()) {
          if (player.mark == mark) {
            color = player.color;
            break;
          }
        }
        text << ansi::color(color) << mark_to_str(mark) << ansi::kReset();
      }
      if (highlight) text << ansi::kReset();
      text << '|';
    }
    text << '\n';
  }

  ss << text.str() << std::endl;
}

std::string IO::compact_board_repr(const Board& board) {
  std::string s;
  for (int row = 0; row < board.size(); ++row) {
    for (int col = 0; col < board.size(); ++col) {
      switch (board.mark_at(row, col)) {
        case Mark::kX:
          s += 'X';
          break;
        case Mark::kO:
          s += 'O';
          break;
        default:
          s += '_';
          break;
      }
    }
    s += '\n';
  }
  return s;
}

std::string IO::status_text(const Board& board, const Outcome& outcome) {
  switch (outcome.kind) {
    case Outcome::kWin:
      return fmt::format("Player \"{}\" won!", label_of(board, outcome.winner));
    case Outcome::kTie:
      return "Tied game!";
    default:
      return fmt::format("{}'s turn", board.current_player().label);
  }
}

std::string IO::label_of(const Board& board, Mark mark) {
  for (const Player& player : board.players()) {
    if (player.mark == mark) return player.label;
  }
  return mark_to_str(mark);
}

}  // namespace tictactoe
