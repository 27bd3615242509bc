#include "games/tictactoe/Game.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace tictactoe {

inline auto Game::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("TicTacToe options");

  return desc.template add_option<"board-size">(
    po::value<int>(&board_size)->default_value(board_size), "board dimension N (N x N board)");
}

}  // namespace tictactoe
