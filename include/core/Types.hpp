#pragma once // Include guard

#include <cstdint> // For fixed-width integer types
#include <optional>
#include <vector>

// Namespace for tile-match core types
namespace tilematch::core {

using TileId = std::uint64_t;

// Highest tile exponent the engine produces or accepts; 2^62 still fits the
// 64-bit point counters.
inline constexpr int MaxTileValue = 62;

// Position of a cell: x is the column, y is the row (0 = top)
struct Position {
    int x{};
    int y{};
};

inline bool operator==(Position a, Position b) noexcept {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(Position a, Position b) noexcept {
    return !(a == b);
}

// A tile holds a power-of-two exponent (displayed value = 2^value).
// Tiles are values: every change produces a new Tile, usually keeping the id
// so the presentation layer can follow the same piece across snapshots.
struct Tile {
    TileId id{};
    int value{};
    // Set only on consumed tiles: the position this tile was merged into.
    std::optional<Position> mergedTarget{};

    bool consumed() const noexcept { return mergedTarget.has_value(); }

    Tile consumedInto(Position target) const {
        return Tile{id, value, target};
    }

    Tile withValue(int newValue) const {
        return Tile{id, newValue, mergedTarget};
    }
};

inline bool operator==(const Tile& a, const Tile& b) noexcept {
    return a.id == b.id && a.value == b.value && a.mergedTarget == b.mergedTarget;
}

inline bool operator!=(const Tile& a, const Tile& b) noexcept {
    return !(a == b);
}

// A detected run of >= 3 equal values collapsing into `origin`.
struct Match {
    Position origin{};
    int newValue{};
    std::vector<Position> consumed; // origin excluded

    // Points awarded for this merge: the display value of the resulting tile.
    std::uint64_t points() const noexcept {
        return std::uint64_t{1} << newValue;
    }
};

} // namespace tilematch::core
