#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <iostream>
#include <optional>

namespace generic {

/*
 * Abstract class. Derived classes must implement the prompt_for_action() and print_state() methods.
 *
 * Reads from in and writes to out, which default to std::cin and std::cout.
 */
template <core::concepts::Game Game>
class HumanTuiPlayer : public core::AbstractPlayer<Game> {
 public:
  using base_t = core::AbstractPlayer<Game>;
  using Action = typename base_t::Action;
  using Outcome = typename base_t::Outcome;

  HumanTuiPlayer(std::istream& in = std::cin, std::ostream& out = std::cout) : in_(in), out_(out) {}
  virtual ~HumanTuiPlayer() {}

  void start_game(const Game&) override;
  Action get_action(Game&) override;
  void end_game(const Game&, const Outcome&) override;

  bool is_human() const override { return true; }
  void set_facing_human_tui_player() override { facing_human_tui_player_ = true; }

 protected:
  /*
   * Reads one action from in_. Returns std::nullopt if the input cannot be parsed. Validity against
   * the game's legal actions is checked by the caller.
   *
   * Throws util::CleanException if the input stream is exhausted.
   */
  virtual std::optional<Action> prompt_for_action(const Game&) = 0;

  virtual void print_state(const Game&, bool terminal) = 0;

  std::istream& in_;
  std::ostream& out_;
  bool facing_human_tui_player_ = false;
};

}  // namespace generic

#include "inline/generic_players/HumanTuiPlayer.inl"
