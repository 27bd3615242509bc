#include "core/GameRunner.hpp"
#include "games/tictactoe/AlphaBetaSearch.hpp"
#include "games/tictactoe/Game.hpp"
#include "games/tictactoe/IO.hpp"
#include "games/tictactoe/PlayerFactory.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

struct Args {
  std::string x_player = "human";
  std::string o_player = "alphabeta";
  int num_games = 1;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc
      .template add_option<"x-player", 'x'>(po::value<std::string>(&x_player)->default_value(x_player),
                                            "player type for X (human, alphabeta, random)")
      .template add_option<"o-player", 'o'>(po::value<std::string>(&o_player)->default_value(o_player),
                                            "player type for O (human, alphabeta, random)")
      .template add_option<"num-games", 'n'>(po::value<int>(&num_games)->default_value(num_games),
                                             "number of games to play without a human seated");
  }
};

bool ask_play_again() {
  while (true) {
    std::cout << "Play again? [y/n]: ";
    std::cout.flush();
    std::string input;
    if (!std::getline(std::cin, input)) return false;
    if (input == "y" || input == "Y") return true;
    if (input == "n" || input == "N") return false;
  }
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    tictactoe::Game::Params game_params;
    tictactoe::AlphaBetaSearch::Params search_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help")
                  .add(args.make_options_description())
                  .add(game_params.make_options_description())
                  .add(search_params.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return 0;
    }

    CLEAN_ASSERT(args.num_games >= 1, "num-games must be positive (got {})", args.num_games);

    util::Logging::init(log_params);
    util::Random::init(random_params);

    tictactoe::Game game(game_params, search_params);

    auto x = tictactoe::PlayerFactory::create(args.x_player);
    auto o = tictactoe::PlayerFactory::create(args.o_player);
    bool human_seated = x->is_human() || o->is_human();
    if (human_seated && !vm["num-games"].defaulted()) {
      LOG_WARN("--num-games is ignored when a human is seated");
    }

    using GameRunner = core::GameRunner<tictactoe::Game>;
    GameRunner runner(GameRunner::player_array_t{x.get(), o.get()});

    int x_wins = 0;
    int o_wins = 0;
    int draws = 0;
    while (true) {
      tictactoe::Outcome outcome = runner.run(game);
      if (outcome.kind == tictactoe::Outcome::kTie) {
        draws++;
      } else if (outcome.winner == tictactoe::Mark::kX) {
        x_wins++;
      } else {
        o_wins++;
      }

      if (!human_seated) {
        tictactoe::IO::print_board(std::cout, game.board(), outcome);
        std::cout << tictactoe::IO::status_text(game.board(), outcome) << std::endl;
      }

      if (human_seated) {
        if (!ask_play_again()) break;
      } else if (runner.num_games_played() >= args.num_games) {
        break;
      }
    }

    LOG_INFO("X ({}) wins: {}  O ({}) wins: {}  draws: {}", x->get_name(), x_wins, o->get_name(),
             o_wins, draws);
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
