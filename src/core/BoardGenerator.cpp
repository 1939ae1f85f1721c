#include "core/BoardGenerator.hpp"
#include "core/BoardScanner.hpp"
#include <stdexcept>

namespace tilematch::core {

Board generateBoard(int size, ITileSource& source)
{
    Board board{size};

    for (int x = 0; x < size; ++x) {
        for (int y = 0; y < size; ++y) {
            board.setTile(Position{x, y}, source.nextTile());
        }
    }

    auto matches = scanAllMatches(board);
    int rounds = 0;

    while (!matches.empty()) {
        if (++rounds > MaxRerollRounds) {
            throw std::runtime_error("generateBoard: could not clear matches");
        }

        for (const auto& match : matches) {
            const Tile& previous = board.tileAt(match.origin);
            board.setTile(match.origin, previous.withValue(source.nextValue()));
        }

        matches = scanAllMatches(board);
    }

    return board;
}

} // namespace tilematch::core
