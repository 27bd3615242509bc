#include "games/tictactoe/Game.hpp"

#include "games/tictactoe/IO.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

namespace tictactoe {

Game::Game() : Game(Params(), AlphaBetaSearch::Params()) {}

Game::Game(const Params& params, const AlphaBetaSearch::Params& search_params,
           const player_vec_t& players)
    : board_(params.board_size, players), search_(search_params) {
  CLEAN_ASSERT(players.size() == size_t(kNumPlayers), "Expected {} players, got {}", kNumPlayers,
               players.size());
  CLEAN_ASSERT(players[0].mark == Mark::kX, "The first player must hold X, not {}",
               mark_to_str(players[0].mark));
  CLEAN_ASSERT(players[1].mark == Mark::kO, "The second player must hold O, not {}",
               mark_to_str(players[1].mark));
  cells_remaining_ = board_.num_cells();
}

Game::Outcome Game::attempt_move(int row, int col, Mark mark) {
  if (mark != Mark::kEmpty && mark != current_mark()) {
    throw IllegalMoveError("It is {}'s turn, not {}'s", current_player().label, mark_to_str(mark));
  }

  board_.apply(Move{row, col, mark});
  cells_remaining_--;

  Outcome outcome = board_.evaluate_outcome();
  LOG_DEBUG("{} plays ({}, {}), {} cells remaining\n{}", mark_to_str(mark), row, col,
            cells_remaining_, IO::compact_board_repr(board_));
  if (!outcome.is_terminal()) {
    board_.toggle_turn();
  }
  return outcome;
}

Cell Game::request_ai_move(int cells_remaining) {
  RELEASE_ASSERT(!outcome().is_terminal(), "AI move requested after the game ended");
  last_search_results_ = search_.search(board_, current_mark(), cells_remaining);
  return last_search_results_->move;
}

Game::Outcome Game::play_ai_move() {
  Cell cell = request_ai_move(cells_remaining_);
  return attempt_move(cell.row, cell.col, current_mark());
}

void Game::reset() {
  board_.reset();
  board_.reset_turn();
  cells_remaining_ = board_.num_cells();
  last_search_results_.reset();
}

Game::Outcome Game::apply_action(const Action& action) {
  return attempt_move(action.row, action.col, current_mark());
}

std::vector<Game::Action> Game::valid_actions() const {
  if (outcome().is_terminal()) return {};
  return board_.empty_cells();
}

}  // namespace tictactoe
