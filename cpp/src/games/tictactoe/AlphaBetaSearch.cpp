#include "games/tictactoe/AlphaBetaSearch.hpp"

#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace tictactoe {

void AlphaBetaSearch::Params::validate() const {
  CLEAN_ASSERT(base_depth >= 0, "base-depth must be non-negative (got {})", base_depth);
  CLEAN_ASSERT(depth_growth >= 0, "depth-growth must be non-negative (got {})", depth_growth);
  CLEAN_ASSERT(max_depth >= 0, "max-depth must be non-negative (got {})", max_depth);
}

AlphaBetaSearch::AlphaBetaSearch() : AlphaBetaSearch(Params()) {}

AlphaBetaSearch::AlphaBetaSearch(const Params& params) : params_(params) { params_.validate(); }

AlphaBetaSearch::SearchResults AlphaBetaSearch::search(Board& board, Mark mark_to_move,
                                                       int remaining_empty_cells) {
  RELEASE_ASSERT(remaining_empty_cells > 0, "No legal move available");
  RELEASE_ASSERT(mark_to_move != Mark::kEmpty);
  DEBUG_ASSERT(remaining_empty_cells == board.num_empty_cells(), "{} != {}", remaining_empty_cells,
               board.num_empty_cells());

  nodes_visited_ = 0;
  cutoffs_ = 0;

  SearchResults results;
  results.max_depth = compute_max_depth(remaining_empty_cells, board.num_cells());
  results.score = -kInfinity;

  bool found = false;
  for (const Cell& cell : board.empty_cells()) {
    int score;
    {
      Board::ScopedMove scoped_move(board, cell, mark_to_move);
      score = minimax(board, mark_to_move, false, -kInfinity, kInfinity, results.max_depth, 0);
    }
    if (params_.verbose) {
      LOG_INFO("AlphaBetaSearch: {} at ({}, {}) scores {}", mark_to_str(mark_to_move), cell.row,
               cell.col, score);
    }
    if (!found || score > results.score) {
      results.move = cell;
      results.score = score;
      found = true;
    }
  }
  RELEASE_ASSERT(found, "No legal move available");

  results.nodes_visited = nodes_visited_;
  results.cutoffs = cutoffs_;

  LOG_DEBUG("AlphaBetaSearch: {} plays ({}, {}) score={} max_depth={} nodes={} cutoffs={}",
            mark_to_str(mark_to_move), results.move.row, results.move.col, results.score,
            results.max_depth, results.nodes_visited, results.cutoffs);
  return results;
}

int AlphaBetaSearch::compute_max_depth(int remaining_empty_cells, int total_cells) const {
  if (params_.max_depth > 0) {
    return params_.max_depth;
  }
  int cells_filled = total_cells - remaining_empty_cells;
  return params_.base_depth + (cells_filled * params_.depth_growth) / total_cells;
}

int AlphaBetaSearch::heuristic_evaluation(const Board& board, Mark ai_mark) {
  Mark opponent_mark = opponent(ai_mark);

  int score = 0;
  for (const WinningLine& line : board.winning_lines()) {
    bool has_ai = false;
    bool has_opponent = false;
    for (const Cell& cell : line) {
      Mark mark = board.mark_at(cell);
      has_ai |= mark == ai_mark;
      has_opponent |= mark == opponent_mark;
    }
    if (has_ai && !has_opponent) {
      score++;
    } else if (has_opponent && !has_ai) {
      score--;
    }
  }
  return score;
}

int AlphaBetaSearch::minimax(Board& board, Mark ai_mark, bool maximizing, int alpha, int beta,
                             int max_depth, int depth) {
  nodes_visited_++;

  Outcome outcome = board.evaluate_outcome();
  if (outcome.kind == Outcome::kWin) {
    return outcome.winner == ai_mark ? kWinScore - depth : -kWinScore + depth;
  }
  if (outcome.kind == Outcome::kTie) {
    return 0;
  }
  if (depth >= max_depth) {
    return heuristic_evaluation(board, ai_mark);
  }

  Mark mark = maximizing ? ai_mark : opponent(ai_mark);
  int best = maximizing ? -kInfinity : kInfinity;
  for (const Cell& cell : board.empty_cells()) {
    Board::ScopedMove scoped_move(board, cell, mark);
    int score = minimax(board, ai_mark, !maximizing, alpha, beta, max_depth, depth + 1);
    if (maximizing) {
      best = std::max(best, score);
      alpha = std::max(alpha, best);
    } else {
      best = std::min(best, score);
      beta = std::min(beta, best);
    }
    if (beta <= alpha) {
      cutoffs_++;
      break;
    }
  }
  return best;
}

}  // namespace tictactoe
