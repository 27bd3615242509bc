#include "games/tictactoe/PlayerFactory.hpp"

#include "games/tictactoe/players/AlphaBetaPlayer.hpp"
#include "games/tictactoe/players/HumanTuiPlayer.hpp"
#include "generic_players/RandomPlayer.hpp"
#include "util/Exceptions.hpp"

namespace tictactoe {

std::unique_ptr<PlayerFactory::Player> PlayerFactory::create(const std::string& type,
                                                             std::istream& in, std::ostream& out) {
  std::unique_ptr<Player> player;
  if (type == "human") {
    player = std::make_unique<HumanTuiPlayer>(in, out);
    player->set_name("Human");
  } else if (type == "alphabeta") {
    player = std::make_unique<AlphaBetaPlayer>();
    player->set_name("AlphaBeta");
  } else if (type == "random") {
    player = std::make_unique<generic::RandomPlayer<Game>>();
    player->set_name("Random");
  } else {
    throw util::CleanException("Unknown player type \"{}\" (expected human, alphabeta, or random)",
                               type);
  }
  return player;
}

}  // namespace tictactoe
