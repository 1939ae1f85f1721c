#pragma once

#include "Types.hpp"
#include <cstdint>
#include <random>

namespace tilematch::core {

// Entropy capability for spawning tiles. The engine never touches global
// randomness; callers pass a source in so tests can script the sequence.
class ITileSource {
public:
    virtual ~ITileSource() = default;

    // A value for a new or rerolled tile, in [1, 4].
    virtual int nextValue() = 0;

    // A fresh, non-consumed tile with an id not handed out before by this source.
    virtual Tile nextTile() = 0;
};

class RandomTileSource : public ITileSource {
public:
    static constexpr int MinValue = 1;
    static constexpr int MaxValue = 4;

    RandomTileSource();
    explicit RandomTileSource(std::uint32_t seed);

    int nextValue() override;
    Tile nextTile() override;

private:
    std::mt19937 rng_;
    TileId nextId_{1};
};

} // namespace tilematch::core
