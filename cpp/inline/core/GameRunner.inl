#include "core/GameRunner.hpp"

#include "util/Exceptions.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>

namespace core {

template <concepts::Game Game>
GameRunner<Game>::GameRunner(const player_array_t& players) : players_(players) {
  bool human_seen = false;
  for (Player* player : players_) {
    if (human_seen) {
      player->set_facing_human_tui_player();
    }
    human_seen |= player->is_human();
  }
}

template <concepts::Game Game>
typename GameRunner<Game>::Outcome GameRunner<Game>::run(Game& game) {
  game_id_t game_id = num_games_played_++;
  game.reset();

  for (size_t p = 0; p < players_.size(); ++p) {
    players_[p]->init_game(game_id, p);
    players_[p]->start_game(game);
  }

  while (true) {
    seat_index_t seat = game.current_seat();
    Player* player = players_[seat];
    auto valid_actions = game.valid_actions();
    auto action = player->get_action(game);
    if (std::find(valid_actions.begin(), valid_actions.end(), action) == valid_actions.end()) {
      throw util::Exception("Player {} ({}) attempted an illegal action", seat,
                            player->get_name());
    }

    Outcome outcome = game.apply_action(action);
    LOG_TRACE("Game {}: seat {} ({}) moved", game_id, seat, player->get_name());
    for (Player* p : players_) {
      p->receive_state_change(seat, game, action);
    }

    if (outcome.is_terminal()) {
      for (Player* p : players_) {
        p->end_game(game, outcome);
      }
      LOG_DEBUG("Game {} finished", game_id);
      return outcome;
    }
  }
}

}  // namespace core
