#pragma once

#include "Board.hpp"
#include "TileSource.hpp"

namespace tilematch::core {

// Upper bound on reroll rounds before generateBoard gives up.
inline constexpr int MaxRerollRounds = 10000;

// Fills a size x size board from `source`, then rerolls the origin tile of
// every match (keeping its id) until no match is left.
// Throws std::invalid_argument for size <= 0 and std::runtime_error if the
// board is still not clean after MaxRerollRounds.
Board generateBoard(int size, ITileSource& source);

} // namespace tilematch::core
