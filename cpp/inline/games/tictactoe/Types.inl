#include "games/tictactoe/Types.hpp"

#include "util/Exceptions.hpp"

namespace tictactoe {

inline const char* mark_to_str(Mark mark) {
  switch (mark) {
    case Mark::kX:
      return "X";
    case Mark::kO:
      return "O";
    default:
      return "-";
  }
}

inline Mark opponent(Mark mark) {
  switch (mark) {
    case Mark::kX:
      return Mark::kO;
    case Mark::kO:
      return Mark::kX;
    default:
      throw util::Exception("opponent() called on the empty mark");
  }
}

inline player_vec_t default_players() {
  return {Player{"X", "blue", Mark::kX}, Player{"O", "green", Mark::kO}};
}

}  // namespace tictactoe
