#include "core/BoardQueries.hpp"
#include "core/MatchDetector.hpp"
#include <array>
#include <cstdlib>

namespace tilematch::core {

bool areAdjacent(Position a, Position b) noexcept {
    return (a.x == b.x && std::abs(a.y - b.y) == 1) ||
           (a.y == b.y && std::abs(a.x - b.x) == 1);
}

std::optional<std::pair<Position, Position>> findAlmostMatch(const Board& board)
{
    for (int x = 0; x < board.size(); ++x) {
        for (int y = 0; y < board.size(); ++y) {
            const Position position{x, y};

            const std::array<Position, 4> neighbours{{
                {x, y - 1}, // up
                {x, y + 1}, // down
                {x - 1, y}, // left
                {x + 1, y}, // right
            }};

            for (const auto& neighbour : neighbours) {
                if (!board.isInside(neighbour)) {
                    continue;
                }

                Board trial = board;
                trial.setTile(position, board.tileAt(neighbour));
                trial.setTile(neighbour, board.tileAt(position));

                if (detectMatch(trial, position) || detectMatch(trial, neighbour)) {
                    return std::make_pair(position, neighbour);
                }
            }
        }
    }

    return std::nullopt;
}

bool isTerminal(const Board& board) {
    return !findAlmostMatch(board).has_value();
}

int maxValue(const Board& board) {
    int best = 0;
    for (int x = 0; x < board.size(); ++x) {
        for (int y = 0; y < board.size(); ++y) {
            const int v = board.tileAt(Position{x, y}).value;
            if (v > best) {
                best = v;
            }
        }
    }
    return best;
}

bool containsValue(const Board& board, int value) {
    return maxValue(board) >= value;
}

} // namespace tilematch::core
