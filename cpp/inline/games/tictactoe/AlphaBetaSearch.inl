#include "games/tictactoe/AlphaBetaSearch.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace tictactoe {

inline auto AlphaBetaSearch::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("AlphaBetaSearch options");

  return desc
    .template add_option<"base-depth">(po::value<int>(&base_depth)->default_value(base_depth),
                                       "search depth on an empty board")
    .template add_option<"depth-growth">(
      po::value<int>(&depth_growth)->default_value(depth_growth),
      "extra search depth gained as the board fills up")
    .template add_option<"max-depth">(
      po::value<int>(&max_depth)->default_value(max_depth),
      "fixed search depth, overriding base-depth/depth-growth (0 means unset)")
    .template add_flag<"verbose-search", "quiet-search">(&verbose, "log the score of every root move",
                                                         "do not log root move scores");
}

}  // namespace tictactoe
