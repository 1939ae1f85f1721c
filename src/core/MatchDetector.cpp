#include "core/MatchDetector.hpp"

namespace tilematch::core {

namespace {
    // Walk from `start` in direction (dx, dy) while the value stays `value`.
    std::vector<Position> sameValuesFrom(const Board& board, Position start,
                                         int dx, int dy, int value)
    {
        std::vector<Position> run;
        Position p{start.x + dx, start.y + dy};
        while (board.isInside(p) && board.tileAt(p).value == value) {
            run.push_back(p);
            p.x += dx;
            p.y += dy;
        }
        return run;
    }

    void append(std::vector<Position>& out, const std::vector<Position>& in) {
        out.insert(out.end(), in.begin(), in.end());
    }
}

std::optional<Match> detectMatch(const Board& board, Position position)
{
    const int value = board.tileAt(position).value;

    const auto up    = sameValuesFrom(board, position,  0, -1, value);
    const auto down  = sameValuesFrom(board, position,  0,  1, value);
    const auto left  = sameValuesFrom(board, position, -1,  0, value);
    const auto right = sameValuesFrom(board, position,  1,  0, value);

    const int vertical   = static_cast<int>(up.size() + down.size());
    const int horizontal = static_cast<int>(left.size() + right.size());

    Match match;
    match.origin = position;

    if (vertical >= MinRunNeighbours) {
        append(match.consumed, up);
        append(match.consumed, down);
    }
    if (horizontal >= MinRunNeighbours) {
        append(match.consumed, left);
        append(match.consumed, right);
    }

    if (match.consumed.empty()) {
        return std::nullopt;
    }

    const int merged = static_cast<int>(match.consumed.size()) - 1;
    match.newValue = value >= MaxTileValue - merged ? MaxTileValue : value + merged;
    return match;
}

} // namespace tilematch::core
