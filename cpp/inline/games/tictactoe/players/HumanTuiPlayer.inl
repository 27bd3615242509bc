#include "games/tictactoe/players/HumanTuiPlayer.hpp"

#include "games/tictactoe/IO.hpp"
#include "util/Exceptions.hpp"
#include "util/StringUtil.hpp"

#include <string>
#include <vector>

namespace tictactoe {

inline std::optional<Cell> HumanTuiPlayer::prompt_for_action(const Game&) {
  out_ << "Enter move [row col]: ";
  out_.flush();
  std::string input;
  if (!std::getline(in_, input)) {
    throw util::CleanException("Input stream closed while waiting for a move");
  }

  std::vector<std::string> tokens = util::split(input);
  if (tokens.size() != 2) return std::nullopt;
  try {
    return Cell{util::atoi_safe(tokens[0]), util::atoi_safe(tokens[1])};
  } catch (const util::CleanException&) {
    return std::nullopt;
  }
}

inline void HumanTuiPlayer::print_state(const Game& game, bool) {
  Outcome outcome = game.outcome();
  IO::print_board(out_, game.board(), outcome);
  out_ << IO::status_text(game.board(), outcome) << std::endl;
}

}  // namespace tictactoe
