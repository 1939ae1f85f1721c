#include "core/MoveResolver.hpp"
#include "core/BoardQueries.hpp"
#include "core/BoardScanner.hpp"
#include "core/Gravity.hpp"
#include "core/MatchDetector.hpp"

namespace tilematch::core {

namespace {
    // One merge step: mark consumed tiles, upgrade origins, let gravity settle.
    // Appends the three snapshots and returns the settled board.
    Board resolveStep(const std::vector<Match>& matches, const Board& current,
                      ITileSource& source, std::vector<BoardSnapshot>& out)
    {
        Board marked = markConsumed(matches, current);

        Board upgraded = marked;
        std::uint64_t points = 0;
        for (const auto& match : matches) {
            upgraded.setTile(match.origin, upgraded.tileAt(match.origin).withValue(match.newValue));
            points += match.points();
        }

        GravityResult gravity = applyGravity(matches, upgraded, source);

        out.push_back(BoardSnapshot{std::move(marked), 0});
        out.push_back(BoardSnapshot{std::move(upgraded), points});
        out.push_back(BoardSnapshot{gravity.settled, 0});

        return std::move(gravity.settled);
    }
}

std::vector<BoardSnapshot> resolveSwap(Position from, Position to, const Board& board,
                                       ITileSource& source)
{
    // Gesture-derived coordinates may overshoot the edge: degrade to a no-op
    if (!board.isInside(from) || !board.isInside(to)) {
        return {BoardSnapshot{board, 0}};
    }

    Board swapped = board;
    swapped.setTile(from, board.tileAt(to));
    swapped.setTile(to, board.tileAt(from));

    auto fromMatch = detectMatch(swapped, from);
    auto toMatch = detectMatch(swapped, to);

    if (!areAdjacent(from, to) || (!fromMatch && !toMatch)) {
        return {BoardSnapshot{std::move(swapped), 0}, BoardSnapshot{board, 0}};
    }

    std::vector<Match> candidates;
    if (fromMatch) {
        candidates.push_back(std::move(*fromMatch));
    }
    if (toMatch) {
        candidates.push_back(std::move(*toMatch));
    }
    auto matches = claimDisjoint(std::move(candidates), board.size());

    std::vector<BoardSnapshot> sequence;
    sequence.push_back(BoardSnapshot{swapped, 0});

    Board current = resolveStep(matches, swapped, source, sequence);

    // Cascades: refilled tiles may line up again
    matches = uniqueMatches(current);
    while (!matches.empty()) {
        current = resolveStep(matches, current, source, sequence);
        matches = uniqueMatches(current);
    }

    return sequence;
}

} // namespace tilematch::core
