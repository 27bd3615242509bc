#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"
#include "games/tictactoe/AlphaBetaSearch.hpp"
#include "games/tictactoe/Board.hpp"
#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Types.hpp"

#include <optional>
#include <vector>

namespace tictactoe {

/*
 * The engine boundary consumed by the presentation layer.
 *
 * Owns one Board, one AlphaBetaSearch, and a count of the cells remaining. Human moves come in via
 * attempt_move(), AI moves are requested via request_ai_move() or played via play_ai_move(). After
 * every accepted move the turn cursor advances unless the game is over.
 */
class Game {
 public:
  using Action = Cell;
  using Outcome = tictactoe::Outcome;
  static constexpr int kNumPlayers = tictactoe::kNumPlayers;

  struct Params {
    auto make_options_description();

    int board_size = kDefaultBoardDimension;
  };

  Game();

  // Throws util::CleanException unless players holds exactly kNumPlayers entries, X first then O.
  Game(const Params& params, const AlphaBetaSearch::Params& search_params,
       const player_vec_t& players = default_players());

  /*
   * Applies mark at (row, col) and returns the resulting outcome.
   *
   * Throws IllegalMoveError, with no state change, if mark is not the current player's mark, or if
   * Board::apply() rejects the move.
   */
  Outcome attempt_move(int row, int col, Mark mark);

  // Runs the search for the current player's mark. The game must not be over.
  Cell request_ai_move(int cells_remaining);

  // request_ai_move() followed by attempt_move().
  Outcome play_ai_move();

  // Clears the board and gives the move back to X.
  void reset();

  // Plays action for the current player. Used by core::GameRunner.
  Outcome apply_action(const Action& action);

  const Board& board() const { return board_; }
  Outcome outcome() const { return board_.evaluate_outcome(); }
  const Player& current_player() const { return board_.current_player(); }
  Mark current_mark() const { return board_.current_player().mark; }
  core::seat_index_t current_seat() const { return board_.turn_index(); }
  int cells_remaining() const { return cells_remaining_; }

  // Empty cells in row-major order, or nothing if the game is over.
  std::vector<Action> valid_actions() const;

  const std::optional<AlphaBetaSearch::SearchResults>& last_search_results() const {
    return last_search_results_;
  }

 private:
  Board board_;
  AlphaBetaSearch search_;
  int cells_remaining_;
  std::optional<AlphaBetaSearch::SearchResults> last_search_results_;
};

}  // namespace tictactoe

static_assert(core::concepts::Game<tictactoe::Game>);

#include "inline/games/tictactoe/Game.inl"
