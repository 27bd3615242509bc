#pragma once

#include "core/AbstractPlayer.hpp"
#include "games/tictactoe/Game.hpp"

namespace tictactoe {

/*
 * Asks the game's own search engine for a move. The strength of play is governed by the
 * AlphaBetaSearch::Params the Game was constructed with.
 */
class AlphaBetaPlayer : public core::AbstractPlayer<Game> {
 public:
  Cell get_action(Game& game) override;
};

}  // namespace tictactoe

#include "inline/games/tictactoe/players/AlphaBetaPlayer.inl"
