#pragma once

#include "games/tictactoe/Board.hpp"
#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Types.hpp"

#include <cstdint>
#include <limits>

namespace tictactoe {

/*
 * Depth-bounded minimax with alpha-beta pruning.
 *
 * Scores are always from the point of view of the searching ("AI") mark: a win found at depth d
 * scores kWinScore - d, a loss scores -kWinScore + d, and a tie scores 0. A position that is still
 * undecided when the depth bound is reached is scored by heuristic_evaluation().
 *
 * The search mutates the board only through Board::ScopedMove, so the board is identical before
 * and after every call. Candidate moves are always tried in row-major order, and a later candidate
 * must score strictly better to replace an earlier one, so the result is deterministic.
 */
class AlphaBetaSearch {
 public:
  static constexpr int kInfinity = std::numeric_limits<int>::max();

  struct Params {
    auto make_options_description();

    // Throws util::CleanException on negative values.
    void validate() const;

    int base_depth = kDefaultBaseDepth;
    int depth_growth = kDefaultDepthGrowth;
    int max_depth = 0;  // if positive, overrides the scaled depth bound
    bool verbose = false;
  };

  struct SearchResults {
    Cell move;
    int score;
    int max_depth;
    int64_t nodes_visited;
    int64_t cutoffs;
  };

  AlphaBetaSearch();
  AlphaBetaSearch(const Params& params);

  const Params& params() const { return params_; }

  /*
   * Returns the best move for mark_to_move, along with search statistics.
   *
   * remaining_empty_cells must equal board.num_empty_cells(), and must be positive.
   */
  SearchResults search(Board& board, Mark mark_to_move, int remaining_empty_cells);

  Cell select_move(Board& board, Mark mark_to_move, int remaining_empty_cells) {
    return search(board, mark_to_move, remaining_empty_cells).move;
  }

  // base_depth + floor(cells_filled / total_cells * depth_growth), unless max_depth is set.
  int compute_max_depth(int remaining_empty_cells, int total_cells) const;

  /*
   * Sum over all winning lines of:
   *
   * +1 if the line contains ai_mark and not its opponent
   * -1 if the line contains the opponent and not ai_mark
   *  0 otherwise
   */
  static int heuristic_evaluation(const Board& board, Mark ai_mark);

  int minimax(Board& board, Mark ai_mark, bool maximizing, int alpha, int beta, int max_depth,
              int depth);

 private:
  Params params_;
  int64_t nodes_visited_ = 0;
  int64_t cutoffs_ = 0;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/AlphaBetaSearch.inl"
