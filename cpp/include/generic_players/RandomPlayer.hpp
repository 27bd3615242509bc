#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/concepts/GameConcept.hpp"
#include "util/Random.hpp"

namespace generic {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves.
 */
template <core::concepts::Game Game>
class RandomPlayer : public core::AbstractPlayer<Game> {
 public:
  using Action = typename core::AbstractPlayer<Game>::Action;

  Action get_action(Game& game) override {
    return util::Random::choose(game.valid_actions());
  }
};

}  // namespace generic
