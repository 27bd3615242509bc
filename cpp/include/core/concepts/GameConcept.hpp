#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <vector>

namespace core {

namespace concepts {

/*
 * All Game classes G driven by core::GameRunner<G> must satisfy core::concepts::Game<G>.
 *
 * A Game owns its state. Players read it through the const accessors and submit moves through
 * apply_action(), which throws if the action is illegal.
 */
template <class G>
concept Game = requires(G& game, const G& cgame, const typename G::Action& action,
                        const typename G::Outcome& outcome) {
  { G::kNumPlayers } -> std::convertible_to<int>;

  { cgame.current_seat() } -> std::same_as<seat_index_t>;
  { cgame.valid_actions() } -> std::same_as<std::vector<typename G::Action>>;
  { cgame.outcome() } -> std::same_as<typename G::Outcome>;
  { outcome.is_terminal() } -> std::same_as<bool>;

  { game.apply_action(action) } -> std::same_as<typename G::Outcome>;
  { game.reset() };
};

}  // namespace concepts

}  // namespace core
