#include "generic_players/HumanTuiPlayer.hpp"

#include <algorithm>

namespace generic {

template <core::concepts::Game Game>
inline void HumanTuiPlayer<Game>::start_game(const Game&) {
  if (facing_human_tui_player_) return;
  out_ << "Starting game " << this->get_game_id() + 1 << std::endl;
}

template <core::concepts::Game Game>
typename HumanTuiPlayer<Game>::Action HumanTuiPlayer<Game>::get_action(Game& game) {
  print_state(game, false);

  auto valid_actions = game.valid_actions();
  bool complain = false;
  while (true) {
    if (complain) {
      out_ << "Invalid input!" << std::endl;
    }
    complain = true;

    std::optional<Action> action = prompt_for_action(game);
    if (!action) continue;
    if (std::find(valid_actions.begin(), valid_actions.end(), *action) == valid_actions.end()) {
      continue;
    }
    return *action;
  }
}

template <core::concepts::Game Game>
inline void HumanTuiPlayer<Game>::end_game(const Game& game, const Outcome&) {
  if (facing_human_tui_player_) return;
  print_state(game, true);
}

}  // namespace generic
