#pragma once

#include "Board.hpp"
#include "Types.hpp"
#include <vector>

namespace tilematch::core {

// Every match on the board, column-major (x outer, y inner).
// Each tile of a run reports its own match, so results overlap.
std::vector<Match> scanAllMatches(const Board& board);

// Reduces candidates to a set where no position is consumed twice:
// highest newValue first, ties broken by ascending origin index (y*size + x);
// a candidate whose origin or consumed tiles were already claimed is dropped.
std::vector<Match> claimDisjoint(std::vector<Match> candidates, int boardSize);

// claimDisjoint(scanAllMatches(board)).
std::vector<Match> uniqueMatches(const Board& board);

} // namespace tilematch::core
