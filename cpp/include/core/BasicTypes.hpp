#pragma once

#include <cstdint>

namespace core {

using seat_index_t = int8_t;
using game_id_t = int64_t;

}  // namespace core
