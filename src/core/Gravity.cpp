#include "core/Gravity.hpp"

namespace tilematch::core {

Board markConsumed(const std::vector<Match>& matches, const Board& board)
{
    Board marked = board;

    for (const auto& match : matches) {
        for (const auto& p : match.consumed) {
            marked.setTile(p, board.tileAt(p).consumedInto(match.origin));
        }
    }

    return marked;
}

GravityResult applyGravity(const std::vector<Match>& matches, const Board& board,
                           ITileSource& source)
{
    Board marked = markConsumed(matches, board);
    Board settled = board;
    const int size = board.size();

    for (int x = 0; x < size; ++x) {
        // Go bottom-up: each survivor drops to the lowest free slot
        int writeY = size - 1;
        for (int y = size - 1; y >= 0; --y) {
            const Tile& tile = marked.tileAt(Position{x, y});
            if (tile.consumed()) {
                continue;
            }
            settled.setTile(Position{x, writeY}, tile);
            --writeY;
        }

        // Refill from the top
        for (int y = writeY; y >= 0; --y) {
            settled.setTile(Position{x, y}, source.nextTile());
        }
    }

    return GravityResult{std::move(marked), std::move(settled)};
}

} // namespace tilematch::core
