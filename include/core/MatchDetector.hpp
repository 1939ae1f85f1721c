#pragma once

#include "Board.hpp"
#include "Types.hpp"
#include <optional>

namespace tilematch::core {

// Minimum number of same-valued neighbours on one axis for that axis to match
// (origin + 2 = a run of three).
inline constexpr int MinRunNeighbours = 2;

/// Checks whether `position` takes part in a run of >= 3 equal values.
/// Vertical and horizontal runs are evaluated independently; when both qualify
/// every tile of both axes is consumed by the same match and the new value
/// counts all of them. The new value never exceeds MaxTileValue.
/// Throws std::out_of_range if `position` is not on the board.
std::optional<Match> detectMatch(const Board& board, Position position);

} // namespace tilematch::core
