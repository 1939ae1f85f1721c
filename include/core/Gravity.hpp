#pragma once

#include "Board.hpp"
#include "TileSource.hpp"
#include "Types.hpp"
#include <vector>

namespace tilematch::core {

struct GravityResult {
    Board marked;  // consumed tiles flagged, nothing moved yet
    Board settled; // survivors compacted down, top refilled
};

// Copy of `board` where every consumed position of `matches` holds a consumed
// tile pointing at its match origin. Values are unchanged.
Board markConsumed(const std::vector<Match>& matches, const Board& board);

// Removes the consumed tiles of `matches` and lets each column fall.
// Surviving tiles keep their id and relative order and never change column;
// the vacated top slots are filled from `source`.
GravityResult applyGravity(const std::vector<Match>& matches, const Board& board,
                           ITileSource& source);

} // namespace tilematch::core
