#include "core/TileSource.hpp"
#include <random>

namespace tilematch::core {

RandomTileSource::RandomTileSource()
    : rng_{std::random_device{}()}
{
}

RandomTileSource::RandomTileSource(std::uint32_t seed)
    : rng_{seed}
{
}

int RandomTileSource::nextValue() {
    std::uniform_int_distribution<int> dist(MinValue, MaxValue);
    return dist(rng_);
}

Tile RandomTileSource::nextTile() {
    Tile tile;
    tile.id = nextId_++;
    tile.value = nextValue();
    return tile;
}

} // namespace tilematch::core
