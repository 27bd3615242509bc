#pragma once

#include "core/AbstractPlayer.hpp"
#include "games/tictactoe/Game.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace tictactoe {

/*
 * Creates players from the type strings accepted on the command line.
 *
 * Human players read from in and write to out.
 */
class PlayerFactory {
 public:
  using Player = core::AbstractPlayer<Game>;

  // Throws util::CleanException for an unknown type.
  static std::unique_ptr<Player> create(const std::string& type, std::istream& in = std::cin,
                                        std::ostream& out = std::cout);

  static std::vector<std::string> types() { return {"human", "alphabeta", "random"}; }
};

}  // namespace tictactoe
