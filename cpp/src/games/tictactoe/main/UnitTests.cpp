#include "core/GameRunner.hpp"
#include "games/tictactoe/AlphaBetaSearch.hpp"
#include "games/tictactoe/Board.hpp"
#include "games/tictactoe/Game.hpp"
#include "games/tictactoe/IO.hpp"
#include "games/tictactoe/PlayerFactory.hpp"
#include "games/tictactoe/Types.hpp"
#include "games/tictactoe/players/AlphaBetaPlayer.hpp"
#include "games/tictactoe/players/HumanTuiPlayer.hpp"
#include "generic_players/RandomPlayer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using AlphaBetaSearch = tictactoe::AlphaBetaSearch;
using Board = tictactoe::Board;
using Cell = tictactoe::Cell;
using Game = tictactoe::Game;
using IllegalMoveError = tictactoe::IllegalMoveError;
using IO = tictactoe::IO;
using Mark = tictactoe::Mark;
using Move = tictactoe::Move;
using Outcome = tictactoe::Outcome;

/*
 * Builds a board from one string per row: 'X', 'O', or '_' for empty. Marks are applied
 * alternately, X first, each in row-major order. Only the last applied mark may complete a line.
 */
Board make_board(const std::vector<std::string>& rows) {
  std::vector<Cell> xs;
  std::vector<Cell> os;
  for (int row = 0; row < (int)rows.size(); ++row) {
    for (int col = 0; col < (int)rows[row].size(); ++col) {
      if (rows[row][col] == 'X') xs.push_back(Cell{row, col});
      if (rows[row][col] == 'O') os.push_back(Cell{row, col});
    }
  }

  Board board(rows.size());
  for (size_t i = 0; i < std::max(xs.size(), os.size()); ++i) {
    if (i < xs.size()) board.apply(Move{xs[i].row, xs[i].col, Mark::kX});
    if (i < os.size()) board.apply(Move{os[i].row, os[i].col, Mark::kO});
  }
  return board;
}

int count_occurrences(const std::string& text, const std::string& needle) {
  int count = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
    count++;
  }
  return count;
}

AlphaBetaSearch::Params exhaustive_params() {
  AlphaBetaSearch::Params params;
  params.max_depth = 9;
  return params;
}

TEST(Board, winning_lines) {
  for (int n = 1; n <= 6; ++n) {
    Board board(n);
    const auto& lines = board.winning_lines();
    EXPECT_EQ(lines.size(), size_t(2 * n + 2)) << "n=" << n;

    std::map<Cell, int> counts;
    for (const auto& line : lines) {
      EXPECT_EQ(line.size(), size_t(n));
      std::map<Cell, int> distinct;
      for (const Cell& cell : line) {
        EXPECT_TRUE(board.in_range(cell.row, cell.col));
        distinct[cell]++;
        counts[cell]++;
      }
      EXPECT_EQ(distinct.size(), size_t(n));
    }

    EXPECT_EQ(counts.size(), size_t(n * n));
    for (const auto& [cell, count] : counts) {
      EXPECT_GE(count, 2) << "(" << cell.row << ", " << cell.col << ") n=" << n;
    }
  }
}

TEST(Board, winning_line_order) {
  Board board;
  const auto& lines = board.winning_lines();
  ASSERT_EQ(lines.size(), 8u);
  EXPECT_EQ(lines[0], (tictactoe::WinningLine{{0, 0}, {0, 1}, {0, 2}}));
  EXPECT_EQ(lines[2], (tictactoe::WinningLine{{2, 0}, {2, 1}, {2, 2}}));
  EXPECT_EQ(lines[3], (tictactoe::WinningLine{{0, 0}, {1, 0}, {2, 0}}));
  EXPECT_EQ(lines[5], (tictactoe::WinningLine{{0, 2}, {1, 2}, {2, 2}}));
  EXPECT_EQ(lines[6], (tictactoe::WinningLine{{0, 0}, {1, 1}, {2, 2}}));
  EXPECT_EQ(lines[7], (tictactoe::WinningLine{{0, 2}, {1, 1}, {2, 0}}));
}

TEST(Board, invalid_construction) {
  EXPECT_THROW(Board(0), util::CleanException);
  EXPECT_THROW(Board(3, tictactoe::player_vec_t{}), util::CleanException);
  EXPECT_THROW(Board(3, {tictactoe::Player{"E", "red", Mark::kEmpty}}), util::CleanException);
}

TEST(Board, apply) {
  Board board;
  EXPECT_EQ(board.apply(Move{1, 1, Mark::kX}), Mark::kX);
  EXPECT_EQ(board.mark_at(1, 1), Mark::kX);
  EXPECT_EQ(board.num_empty_cells(), 8);
  EXPECT_TRUE(board.is_legal(Move{0, 0, Mark::kO}));
  EXPECT_FALSE(board.is_legal(Move{1, 1, Mark::kO}));
  EXPECT_FALSE(board.is_legal(Move{3, 0, Mark::kO}));
}

TEST(Board, illegal_moves_leave_board_unchanged) {
  Board board = make_board({"X__", "_O_", "___"});
  Board before = board;

  EXPECT_THROW(board.apply(Move{0, 0, Mark::kO}), IllegalMoveError);
  EXPECT_THROW(board.apply(Move{1, 1, Mark::kX}), IllegalMoveError);
  EXPECT_THROW(board.apply(Move{-1, 0, Mark::kX}), IllegalMoveError);
  EXPECT_THROW(board.apply(Move{0, 3, Mark::kX}), IllegalMoveError);
  EXPECT_THROW(board.apply(Move{2, 2, Mark::kEmpty}), IllegalMoveError);
  EXPECT_EQ(board, before);

  Board won = make_board({"XXX", "OO_", "___"});
  Board won_before = won;
  EXPECT_FALSE(won.is_legal(Move{2, 2, Mark::kO}));
  EXPECT_THROW(won.apply(Move{2, 2, Mark::kO}), IllegalMoveError);
  EXPECT_EQ(won, won_before);
}

TEST(Board, turn_order) {
  Board board;
  EXPECT_FALSE(board.is_legal(Move{0, 0, Mark::kO}));
  EXPECT_THROW(board.apply(Move{0, 0, Mark::kO}), IllegalMoveError);
  EXPECT_EQ(board, Board());

  board.apply(Move{0, 0, Mark::kX});
  Board before = board;
  EXPECT_FALSE(board.is_legal(Move{1, 1, Mark::kX}));
  EXPECT_THROW(board.apply(Move{1, 1, Mark::kX}), IllegalMoveError);
  EXPECT_EQ(board, before);

  board.apply(Move{1, 1, Mark::kO});
  before = board;
  EXPECT_THROW(board.apply(Move{2, 2, Mark::kO}), IllegalMoveError);
  EXPECT_EQ(board, before);
  EXPECT_EQ(board.num_marks(Mark::kX), 1);
  EXPECT_EQ(board.num_marks(Mark::kO), 1);
  EXPECT_EQ(board.num_marks(Mark::kEmpty), 7);
}

TEST(Board, win_detection) {
  Board board = make_board({"XX_", "OO_", "___"});
  EXPECT_EQ(board.evaluate_outcome(), Outcome::in_progress());
  EXPECT_FALSE(board.has_winner());

  board.apply(Move{0, 2, Mark::kX});
  Outcome outcome = board.evaluate_outcome();
  EXPECT_EQ(outcome, Outcome::win(Mark::kX, {{0, 0}, {0, 1}, {0, 2}}));
  EXPECT_TRUE(outcome.is_terminal());
  EXPECT_TRUE(board.has_winner());
  EXPECT_FALSE(board.is_tied());
}

TEST(Board, win_detection_larger_board) {
  Board board = make_board({"O__X", "_OX_", "_XO_", "X___"});
  Outcome outcome = board.evaluate_outcome();
  EXPECT_EQ(outcome.kind, Outcome::kWin);
  EXPECT_EQ(outcome.winner, Mark::kX);
  EXPECT_EQ(outcome.line, (tictactoe::WinningLine{{0, 3}, {1, 2}, {2, 1}, {3, 0}}));
}

TEST(Board, tie_detection) {
  Board board = make_board({"XOX", "XOO", "OXX"});
  EXPECT_EQ(board.evaluate_outcome(), Outcome::tie());
  EXPECT_TRUE(board.is_tied());
  EXPECT_FALSE(board.has_winner());
  EXPECT_EQ(board.num_empty_cells(), 0);
  EXPECT_TRUE(board.empty_cells().empty());
}

TEST(Board, reset) {
  Board board = make_board({"XXX", "OO_", "___"});
  auto lines = board.winning_lines();

  board.reset();
  EXPECT_EQ(board.evaluate_outcome(), Outcome::in_progress());
  EXPECT_EQ(board.num_empty_cells(), 9);
  for (int row = 0; row < 3; ++row) {
    for (int col = 0; col < 3; ++col) {
      EXPECT_EQ(board.mark_at(row, col), Mark::kEmpty);
    }
  }
  EXPECT_EQ(board.winning_lines(), lines);
  EXPECT_EQ(board, Board());
}

TEST(Board, evaluate_outcome_is_pure) {
  Board board = make_board({"XO_", "_X_", "O__"});
  Board before = board;
  Outcome a = board.evaluate_outcome();
  Outcome b = board.evaluate_outcome();
  EXPECT_EQ(a, b);
  EXPECT_EQ(board, before);
}

TEST(Board, empty_cells_row_major) {
  Board board = make_board({"X_O", "_X_", "___"});
  std::vector<Cell> expected = {{0, 1}, {1, 0}, {1, 2}, {2, 0}, {2, 1}, {2, 2}};
  EXPECT_EQ(board.empty_cells(), expected);
}

TEST(Board, toggle_turn) {
  Board board;
  EXPECT_EQ(board.current_player().mark, Mark::kX);
  board.toggle_turn();
  EXPECT_EQ(board.current_player().mark, Mark::kO);
  EXPECT_EQ(board.current_player().label, "O");
  board.toggle_turn();
  EXPECT_EQ(board.current_player().mark, Mark::kX);
  board.toggle_turn();
  board.reset_turn();
  EXPECT_EQ(board.turn_index(), 0);

  tictactoe::player_vec_t players = {
    {"A", "red", Mark::kX}, {"B", "green", Mark::kO}, {"C", "blue", Mark::kX}};
  Board three(3, players);
  std::vector<std::string> labels;
  for (int i = 0; i < 7; ++i) {
    labels.push_back(three.current_player().label);
    three.toggle_turn();
  }
  EXPECT_EQ(labels, (std::vector<std::string>{"A", "B", "C", "A", "B", "C", "A"}));
}

TEST(Board, scoped_move) {
  Board board = make_board({"X__", "___", "___"});
  Board before = board;
  {
    Board::ScopedMove move(board, Cell{2, 2}, Mark::kO);
    EXPECT_EQ(board.mark_at(2, 2), Mark::kO);
    EXPECT_EQ(board.num_empty_cells(), 7);
  }
  EXPECT_EQ(board, before);

  try {
    Board::ScopedMove move(board, Cell{1, 1}, Mark::kO);
    throw std::runtime_error("interrupted");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(board, before);
}

TEST(AlphaBetaSearch, compute_max_depth) {
  AlphaBetaSearch search;
  EXPECT_EQ(search.compute_max_depth(9, 9), 2);
  EXPECT_EQ(search.compute_max_depth(8, 9), 2);
  EXPECT_EQ(search.compute_max_depth(5, 9), 2);
  EXPECT_EQ(search.compute_max_depth(4, 9), 3);
  EXPECT_EQ(search.compute_max_depth(1, 9), 3);
  EXPECT_EQ(search.compute_max_depth(8, 16), 3);

  AlphaBetaSearch::Params params;
  params.base_depth = 1;
  params.depth_growth = 6;
  EXPECT_EQ(AlphaBetaSearch(params).compute_max_depth(3, 9), 5);

  EXPECT_EQ(AlphaBetaSearch(exhaustive_params()).compute_max_depth(9, 9), 9);
  EXPECT_EQ(AlphaBetaSearch(exhaustive_params()).compute_max_depth(2, 9), 9);
}

TEST(AlphaBetaSearch, invalid_params) {
  AlphaBetaSearch::Params params;
  params.base_depth = -1;
  EXPECT_THROW(AlphaBetaSearch{params}, util::CleanException);

  params = AlphaBetaSearch::Params();
  params.max_depth = -2;
  EXPECT_THROW(AlphaBetaSearch{params}, util::CleanException);
}

TEST(AlphaBetaSearch, heuristic_evaluation) {
  Board empty;
  EXPECT_EQ(AlphaBetaSearch::heuristic_evaluation(empty, Mark::kO), 0);

  Board center = make_board({"___", "_X_", "___"});
  EXPECT_EQ(AlphaBetaSearch::heuristic_evaluation(center, Mark::kO), -4);
  EXPECT_EQ(AlphaBetaSearch::heuristic_evaluation(center, Mark::kX), 4);

  Board corner = make_board({"O__", "_X_", "___"});
  EXPECT_EQ(AlphaBetaSearch::heuristic_evaluation(corner, Mark::kO), -1);
  EXPECT_EQ(AlphaBetaSearch::heuristic_evaluation(corner, Mark::kX), 1);
}

TEST(AlphaBetaSearch, terminal_scores) {
  Board board = make_board({"XX_", "OOO", "X__"});
  AlphaBetaSearch search;
  EXPECT_EQ(search.minimax(board, Mark::kO, true, -AlphaBetaSearch::kInfinity,
                           AlphaBetaSearch::kInfinity, 5, 3),
            tictactoe::kWinScore - 3);
  EXPECT_EQ(search.minimax(board, Mark::kX, false, -AlphaBetaSearch::kInfinity,
                           AlphaBetaSearch::kInfinity, 5, 3),
            -tictactoe::kWinScore + 3);

  Board tie = make_board({"XOX", "XOO", "OXX"});
  EXPECT_EQ(search.minimax(tie, Mark::kX, true, -AlphaBetaSearch::kInfinity,
                           AlphaBetaSearch::kInfinity, 5, 0),
            0);
}

TEST(AlphaBetaSearch, takes_immediate_win) {
  Board board = make_board({"X_X", "__X", "OO_"});
  AlphaBetaSearch search;
  auto results = search.search(board, Mark::kO, board.num_empty_cells());
  EXPECT_EQ(results.move, (Cell{2, 2}));
  EXPECT_EQ(results.score, tictactoe::kWinScore);
  EXPECT_EQ(results.max_depth, 3);
}

TEST(AlphaBetaSearch, blocks_forced_loss) {
  Board board = make_board({"XO_", "_X_", "___"});
  AlphaBetaSearch search;
  EXPECT_EQ(search.select_move(board, Mark::kO, board.num_empty_cells()), (Cell{2, 2}));
}

TEST(AlphaBetaSearch, board_unchanged_and_deterministic) {
  Board board = make_board({"X__", "_O_", "__X"});
  Board before = board;

  AlphaBetaSearch search;
  auto first = search.search(board, Mark::kO, board.num_empty_cells());
  EXPECT_EQ(board, before);

  for (int i = 0; i < 3; ++i) {
    auto again = search.search(board, Mark::kO, board.num_empty_cells());
    EXPECT_EQ(again.move, first.move);
    EXPECT_EQ(again.score, first.score);
    EXPECT_EQ(again.nodes_visited, first.nodes_visited);
    EXPECT_EQ(board, before);
  }
}

TEST(AlphaBetaSearch, exhaustive_opening) {
  Board board;
  AlphaBetaSearch search(exhaustive_params());
  auto results = search.search(board, Mark::kX, 9);

  // Every opening draws under perfect play, so the first cell in row-major order is kept.
  EXPECT_EQ(results.move, (Cell{0, 0}));
  EXPECT_EQ(results.score, 0);
  EXPECT_EQ(results.max_depth, 9);
  EXPECT_GT(results.nodes_visited, 0);
  EXPECT_GT(results.cutoffs, 0);
  EXPECT_EQ(board, Board());
}

TEST(AlphaBetaSearch, full_board) {
  Board board = make_board({"XOX", "XOO", "OXX"});
  AlphaBetaSearch search;
  EXPECT_THROW(search.search(board, Mark::kX, 0), util::ReleaseAssertionError);
}

TEST(AlphaBetaSearch, options) {
  namespace po2 = boost_util::program_options;

  AlphaBetaSearch::Params params;
  auto desc = params.make_options_description();
  std::vector<std::string> args = {"--base-depth",  "3", "--depth-growth",  "4",
                                   "--max-depth", "9", "--verbose-search"};
  po2::parse_args(desc, args);
  EXPECT_EQ(params.base_depth, 3);
  EXPECT_EQ(params.depth_growth, 4);
  EXPECT_EQ(params.max_depth, 9);
  EXPECT_TRUE(params.verbose);

  Game::Params game_params;
  auto game_desc = game_params.make_options_description();
  std::vector<std::string> game_args = {"--board-size", "4"};
  po2::parse_args(game_desc, game_args);
  EXPECT_EQ(game_params.board_size, 4);
}

/*
 * Plays every possible X strategy against an exhaustive O, and counts the outcomes.
 */
void play_all_x_strategies(const Game& game, int& o_wins, int& ties, int& x_wins) {
  for (const Cell& cell : game.valid_actions()) {
    Game copy = game;
    Outcome outcome = copy.attempt_move(cell.row, cell.col, Mark::kX);
    if (!outcome.is_terminal()) {
      outcome = copy.play_ai_move();
    }

    if (outcome.kind == Outcome::kTie) {
      ties++;
    } else if (outcome.kind == Outcome::kWin) {
      if (outcome.winner == Mark::kX) {
        x_wins++;
      } else {
        o_wins++;
      }
    } else {
      play_all_x_strategies(copy, o_wins, ties, x_wins);
    }
  }
}

TEST(AlphaBetaSearch, exhaustive_o_never_loses) {
  Game game(Game::Params(), exhaustive_params());
  int o_wins = 0;
  int ties = 0;
  int x_wins = 0;
  play_all_x_strategies(game, o_wins, ties, x_wins);

  EXPECT_EQ(x_wins, 0);
  EXPECT_GT(o_wins, 0);
  EXPECT_GT(ties, 0);
}

TEST(Game, turn_enforcement) {
  Game game;
  EXPECT_EQ(game.current_mark(), Mark::kX);
  EXPECT_EQ(game.current_seat(), tictactoe::kX);

  EXPECT_THROW(game.attempt_move(0, 0, Mark::kO), IllegalMoveError);
  EXPECT_EQ(game.board(), Board());
  EXPECT_EQ(game.cells_remaining(), 9);

  EXPECT_EQ(game.attempt_move(0, 0, Mark::kX), Outcome::in_progress());
  EXPECT_EQ(game.current_mark(), Mark::kO);
  EXPECT_EQ(game.cells_remaining(), 8);

  EXPECT_THROW(game.attempt_move(0, 0, Mark::kO), IllegalMoveError);
  EXPECT_THROW(game.attempt_move(1, 1, Mark::kX), IllegalMoveError);
  EXPECT_EQ(game.current_mark(), Mark::kO);
  EXPECT_EQ(game.cells_remaining(), 8);
}

TEST(Game, win_freezes_turn) {
  Game game;
  game.attempt_move(0, 0, Mark::kX);
  game.attempt_move(1, 0, Mark::kO);
  game.attempt_move(0, 1, Mark::kX);
  game.attempt_move(1, 1, Mark::kO);
  Outcome outcome = game.attempt_move(0, 2, Mark::kX);

  EXPECT_EQ(outcome, Outcome::win(Mark::kX, {{0, 0}, {0, 1}, {0, 2}}));
  EXPECT_EQ(game.outcome(), outcome);
  EXPECT_EQ(game.current_mark(), Mark::kX);
  EXPECT_TRUE(game.valid_actions().empty());
  EXPECT_THROW(game.attempt_move(2, 2, Mark::kX), IllegalMoveError);
  EXPECT_THROW(game.request_ai_move(game.cells_remaining()), util::ReleaseAssertionError);
}

TEST(Game, reset) {
  Game game;
  game.attempt_move(1, 1, Mark::kX);
  game.play_ai_move();
  EXPECT_TRUE(game.last_search_results().has_value());

  game.reset();
  EXPECT_EQ(game.current_mark(), Mark::kX);
  EXPECT_EQ(game.cells_remaining(), 9);
  EXPECT_EQ(game.board(), Board());
  EXPECT_EQ(game.outcome(), Outcome::in_progress());
  EXPECT_FALSE(game.last_search_results().has_value());

  // reset() also gives the move back to X when called mid-turn for O
  game.attempt_move(0, 0, Mark::kX);
  EXPECT_EQ(game.current_mark(), Mark::kO);
  game.reset();
  EXPECT_EQ(game.current_mark(), Mark::kX);
}

TEST(Game, play_ai_move) {
  Game game;
  game.attempt_move(0, 0, Mark::kX);
  Cell cell = game.request_ai_move(game.cells_remaining());
  EXPECT_EQ(game.board().mark_at(cell), Mark::kEmpty);
  EXPECT_EQ(game.cells_remaining(), 8);

  Outcome outcome = game.play_ai_move();
  EXPECT_EQ(outcome, Outcome::in_progress());
  EXPECT_EQ(game.board().mark_at(cell), Mark::kO);
  EXPECT_EQ(game.cells_remaining(), 7);
  EXPECT_EQ(game.current_mark(), Mark::kX);
  EXPECT_EQ(game.last_search_results()->max_depth, 2);
}

TEST(Game, invalid_config) {
  Game::Params params;
  params.board_size = 0;
  EXPECT_THROW(Game(params, AlphaBetaSearch::Params()), util::CleanException);

  tictactoe::player_vec_t same_marks = {{"X", "blue", Mark::kX}, {"Y", "red", Mark::kX}};
  EXPECT_THROW(Game(Game::Params(), AlphaBetaSearch::Params(), same_marks), util::CleanException);

  tictactoe::player_vec_t one_player = {{"X", "blue", Mark::kX}};
  EXPECT_THROW(Game(Game::Params(), AlphaBetaSearch::Params(), one_player), util::CleanException);

  tictactoe::player_vec_t o_first = {{"O", "green", Mark::kO}, {"X", "blue", Mark::kX}};
  EXPECT_THROW(Game(Game::Params(), AlphaBetaSearch::Params(), o_first), util::CleanException);

  tictactoe::player_vec_t relabeled = {{"Alice", "red", Mark::kX}, {"Bob", "cyan", Mark::kO}};
  Game game(Game::Params(), AlphaBetaSearch::Params(), relabeled);
  EXPECT_EQ(game.current_player().label, "Alice");
}

TEST(IO, compact_board_repr) {
  Board board = make_board({"X_O", "_X_", "__O"});
  EXPECT_EQ(IO::compact_board_repr(board), "X_O\n_X_\n__O\n");
}

TEST(IO, print_board) {
  Board board = make_board({"X__", "_O_", "___"});
  std::ostringstream ss;
  IO::print_board(ss, board, board.evaluate_outcome());

  std::vector<std::string> lines = util::splitlines(ss.str());
  ASSERT_GE(lines.size(), 4u);
  EXPECT_EQ(lines[0], "   0 1 2");
  EXPECT_EQ(lines[1], " 0|X| | |");
  EXPECT_EQ(lines[2], " 1| |O| |");
  EXPECT_EQ(lines[3], " 2| | | |");
}

TEST(IO, status_text) {
  Board board;
  EXPECT_EQ(IO::status_text(board, board.evaluate_outcome()), "X's turn");
  board.toggle_turn();
  EXPECT_EQ(IO::status_text(board, board.evaluate_outcome()), "O's turn");

  Board won = make_board({"XX_", "OOO", "X__"});
  EXPECT_EQ(IO::status_text(won, won.evaluate_outcome()), "Player \"O\" won!");

  Board tie = make_board({"XOX", "XOO", "OXX"});
  EXPECT_EQ(IO::status_text(tie, tie.evaluate_outcome()), "Tied game!");
}

TEST(HumanTuiPlayer, reprompts_until_valid) {
  Game game;
  game.attempt_move(1, 1, Mark::kX);

  std::istringstream in("garbage\n5 5\n1 1\n1\n0 2\n");
  std::ostringstream out;
  tictactoe::HumanTuiPlayer player(in, out);
  player.init_game(0, tictactoe::kO);

  EXPECT_EQ(player.get_action(game), (Cell{0, 2}));
  EXPECT_TRUE(player.is_human());

  std::string output = out.str();
  EXPECT_EQ(count_occurrences(output, "Invalid input!"), 4);
  EXPECT_NE(output.find("O's turn"), std::string::npos);
  EXPECT_NE(output.find("Enter move [row col]: "), std::string::npos);
}

TEST(HumanTuiPlayer, end_of_input) {
  Game game;
  std::istringstream in("");
  std::ostringstream out;
  tictactoe::HumanTuiPlayer player(in, out);
  EXPECT_THROW(player.get_action(game), util::CleanException);
}

TEST(PlayerFactory, create) {
  auto human = tictactoe::PlayerFactory::create("human");
  auto alphabeta = tictactoe::PlayerFactory::create("alphabeta");
  auto random = tictactoe::PlayerFactory::create("random");

  EXPECT_TRUE(human->is_human());
  EXPECT_FALSE(alphabeta->is_human());
  EXPECT_FALSE(random->is_human());
  EXPECT_EQ(alphabeta->get_name(), "AlphaBeta");

  EXPECT_THROW(tictactoe::PlayerFactory::create("minimax"), util::CleanException);
}

using GameRunner = core::GameRunner<Game>;

TEST(GameRunner, scripted_humans) {
  std::istringstream x_in("0 0\n0 1\n0 2\n");
  std::istringstream o_in("1 0\n1 1\n");
  std::ostringstream out;
  tictactoe::HumanTuiPlayer x(x_in, out);
  tictactoe::HumanTuiPlayer o(o_in, out);

  Game game;
  GameRunner runner(GameRunner::player_array_t{&x, &o});
  Outcome outcome = runner.run(game);

  EXPECT_EQ(outcome, Outcome::win(Mark::kX, {{0, 0}, {0, 1}, {0, 2}}));
  EXPECT_EQ(runner.num_games_played(), 1);
  EXPECT_EQ(x.get_my_seat(), tictactoe::kX);
  EXPECT_EQ(o.get_my_seat(), tictactoe::kO);
  EXPECT_EQ(count_occurrences(out.str(), "Starting game 1"), 1);
  EXPECT_EQ(count_occurrences(out.str(), "Player \"X\" won!"), 1);
}

TEST(GameRunner, human_behind_engine_keeps_banner) {
  std::istringstream o_in("");
  std::ostringstream out;
  tictactoe::AlphaBetaPlayer x;
  tictactoe::HumanTuiPlayer o(o_in, out);

  Game game;
  GameRunner runner(GameRunner::player_array_t{&x, &o});
  EXPECT_THROW(runner.run(game), util::CleanException);
  EXPECT_EQ(count_occurrences(out.str(), "Starting game 1"), 1);
  EXPECT_EQ(count_occurrences(out.str(), "O's turn"), 1);
}

TEST(GameRunner, exhaustive_self_play_ties) {
  tictactoe::AlphaBetaPlayer x;
  tictactoe::AlphaBetaPlayer o;

  Game game(Game::Params(), exhaustive_params());
  GameRunner runner(GameRunner::player_array_t{&x, &o});
  EXPECT_EQ(runner.run(game), Outcome::tie());
}

TEST(GameRunner, random_never_beats_exhaustive) {
  util::Random::set_seed(1);
  generic::RandomPlayer<Game> x;
  tictactoe::AlphaBetaPlayer o;

  Game game(Game::Params(), exhaustive_params());
  GameRunner runner(GameRunner::player_array_t{&x, &o});
  for (int i = 0; i < 20; ++i) {
    Outcome outcome = runner.run(game);
    EXPECT_TRUE(outcome.is_terminal());
    EXPECT_NE(outcome.winner, Mark::kX);
  }
  EXPECT_EQ(runner.num_games_played(), 20);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
