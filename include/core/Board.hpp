#pragma once

#include "Types.hpp"
#include <vector>

namespace tilematch::core {

// Square grid of tiles, stored column-major (cell (x, y) lives in column x).
// Every cell always holds a tile; consumed tiles stay in place until gravity
// compacts them away. Copying a Board yields an independent grid.
class Board {
public:
    explicit Board(int size);

    int size() const noexcept { return size_; }

    const Tile& tileAt(Position p) const;
    void setTile(Position p, const Tile& tile);

    bool isInside(Position p) const noexcept {
        return p.x >= 0 && p.x < size_ && p.y >= 0 && p.y < size_;
    }

    // Bijection over [0, size*size) used for "seen" bookkeeping: y*size + x.
    int positionToIndex(Position p) const;
    Position indexToPosition(int index) const;

    // Compares size and per-cell values, ignoring ids and consumed state.
    bool sameValues(const Board& other) const noexcept;

    bool operator==(const Board& other) const noexcept;
    bool operator!=(const Board& other) const noexcept { return !(*this == other); }

private:
    int size_;
    std::vector<Tile> tiles_; // size_ * size_, column-major

    int storageIndex(Position p) const noexcept {
        return p.x * size_ + p.y;
    }
};

} // namespace tilematch::core
