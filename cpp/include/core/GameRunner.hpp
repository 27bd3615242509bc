#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <array>

namespace core {

/*
 * Plays one game at a time between a fixed array of players. players[s] occupies seat s.
 *
 * The runner owns the move loop: it asks the player on move for an action, validates it against
 * Game::valid_actions(), applies it via Game::apply_action(), and echoes it to every player.
 */
template <concepts::Game Game>
class GameRunner {
 public:
  using Player = AbstractPlayer<Game>;
  using Outcome = typename Game::Outcome;
  using player_array_t = std::array<Player*, Game::kNumPlayers>;

  GameRunner(const player_array_t& players);

  // Resets game, plays it to completion, and returns the terminal outcome.
  Outcome run(Game& game);

  int num_games_played() const { return num_games_played_; }

 private:
  player_array_t players_;
  int num_games_played_ = 0;
};

}  // namespace core

#include "inline/core/GameRunner.inl"
