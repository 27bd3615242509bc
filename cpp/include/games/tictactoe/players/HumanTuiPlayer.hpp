#pragma once

#include "games/tictactoe/Game.hpp"
#include "generic_players/HumanTuiPlayer.hpp"

#include <optional>

namespace tictactoe {

class HumanTuiPlayer : public generic::HumanTuiPlayer<Game> {
 public:
  using base_t = generic::HumanTuiPlayer<Game>;
  using base_t::base_t;

 private:
  std::optional<Cell> prompt_for_action(const Game&) override;
  void print_state(const Game&, bool terminal) override;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/players/HumanTuiPlayer.inl"
