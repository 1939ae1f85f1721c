#pragma once

#include "Board.hpp"
#include "Types.hpp"
#include <optional>
#include <utility>

namespace tilematch::core {

// Tile exponent whose display value is 2048.
inline constexpr int Value2048 = 11;

// True iff a and b are cardinal neighbours (distance 1 on exactly one axis).
bool areAdjacent(Position a, Position b) noexcept;

// First swap that would produce a match. Scan is column-major; neighbours
// are tried up, down, left, right. Used for hints and game-over detection.
std::optional<std::pair<Position, Position>> findAlmostMatch(const Board& board);

// Game over: no single adjacent swap produces a match.
bool isTerminal(const Board& board);

int maxValue(const Board& board);

// True if some tile has reached at least `value`.
bool containsValue(const Board& board, int value);

} // namespace tilematch::core
