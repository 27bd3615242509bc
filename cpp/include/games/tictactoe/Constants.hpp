#pragma once

#include "core/BasicTypes.hpp"

namespace tictactoe {

const int kDefaultBoardDimension = 3;
const int kNumPlayers = 2;

const core::seat_index_t kX = 0;
const core::seat_index_t kO = 1;

// A win at search depth d scores kWinScore - d for the searching side.
const int kWinScore = 10;

// Depth bound: kDefaultBaseDepth + floor(cells_filled / total_cells * kDefaultDepthGrowth).
const int kDefaultBaseDepth = 2;
const int kDefaultDepthGrowth = 2;

}  // namespace tictactoe
