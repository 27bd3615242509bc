#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/GameConcept.hpp"

#include <string>

namespace core {

/*
 * Base class for all players.
 *
 * There are 4 main virtual functions to override:
 *
 * - start_game()
 * - receive_state_change()
 * - get_action()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so you should override these methods if there is state that you
 * want to clear between games.
 *
 * receive_state_change() is called after every applied action. Note that you get this callback
 * even after you make your own turn as a sort of "echo" of your own action.
 *
 * get_action() is called when it is your turn to make a move. The game is passed by non-const
 * reference so that a player can run the game's own search engine, which restores the game state
 * before returning. A player must not apply the action itself: the GameRunner does that.
 */
template <concepts::Game Game>
class AbstractPlayer {
 public:
  using Action = typename Game::Action;
  using Outcome = typename Game::Outcome;

  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  game_id_t get_game_id() const { return game_id_; }
  seat_index_t get_my_seat() const { return my_seat_; }

  void init_game(game_id_t game_id, seat_index_t seat_assignment);

  virtual void start_game(const Game&) {}
  virtual void receive_state_change(seat_index_t, const Game&, const Action&) {}
  virtual Action get_action(Game&) = 0;
  virtual void end_game(const Game&, const Outcome&) {}

  // Players that interact with a human at the terminal return true here.
  virtual bool is_human() const { return false; }

  /*
   * GameRunner invokes set_facing_human_tui_player() on a player if a human player occupies an
   * earlier seat. A human player that receives it shares the terminal with that earlier seat, and
   * leaves the per-game banner and the final board to it.
   */
  virtual void set_facing_human_tui_player() {}

 private:
  std::string name_;
  game_id_t game_id_ = -1;
  seat_index_t my_seat_ = -1;
};

}  // namespace core

#include "inline/core/AbstractPlayer.inl"
