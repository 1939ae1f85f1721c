#pragma once

#include "Board.hpp"
#include "TileSource.hpp"
#include "Types.hpp"
#include <cstdint>
#include <vector>

namespace tilematch::core {

// One animation beat: a board state and the points earned reaching it.
struct BoardSnapshot {
    Board board;
    std::uint64_t points{0};
};

/// Resolves a player's swap into the ordered list of boards to play back.
///
/// - Either position off the board: [{board, 0}] (no-op).
/// - Not adjacent, or no match at `from`/`to` after swapping:
///   [{swapped, 0}, {board, 0}] (there and back).
/// - Otherwise: [swapped, marked, upgraded, settled] followed by one
///   (marked, upgraded, settled) triple per cascade step, until the settled
///   board has no matches left. Only the upgraded snapshots carry points.
///
/// `board` is never modified; new tiles come from `source`.
std::vector<BoardSnapshot> resolveSwap(Position from, Position to, const Board& board,
                                       ITileSource& source);

} // namespace tilematch::core
