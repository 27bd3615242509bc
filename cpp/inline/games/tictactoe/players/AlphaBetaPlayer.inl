#include "games/tictactoe/players/AlphaBetaPlayer.hpp"

#include "util/LoggingUtil.hpp"

namespace tictactoe {

inline Cell AlphaBetaPlayer::get_action(Game& game) {
  Cell cell = game.request_ai_move(game.cells_remaining());
  const auto& results = game.last_search_results();
  LOG_DEBUG("{} ({}) chose ({}, {}) with score {}", get_name(), game.current_player().label,
            cell.row, cell.col, results->score);
  return cell;
}

}  // namespace tictactoe
