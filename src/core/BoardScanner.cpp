#include "core/BoardScanner.hpp"
#include "core/MatchDetector.hpp"
#include <algorithm>

namespace tilematch::core {

std::vector<Match> scanAllMatches(const Board& board)
{
    std::vector<Match> matches;

    for (int x = 0; x < board.size(); ++x) {
        for (int y = 0; y < board.size(); ++y) {
            if (auto match = detectMatch(board, Position{x, y})) {
                matches.push_back(std::move(*match));
            }
        }
    }

    return matches;
}

std::vector<Match> claimDisjoint(std::vector<Match> candidates, int boardSize)
{
    auto indexOf = [boardSize](Position p) { return p.y * boardSize + p.x; };

    std::sort(candidates.begin(), candidates.end(),
              [&indexOf](const Match& a, const Match& b) {
                  if (a.newValue != b.newValue) {
                      return a.newValue > b.newValue;
                  }
                  return indexOf(a.origin) < indexOf(b.origin);
              });

    std::vector<bool> claimed(static_cast<std::size_t>(boardSize) * boardSize, false);
    std::vector<Match> result;

    for (auto& candidate : candidates) {
        const bool contested =
            claimed[indexOf(candidate.origin)] ||
            std::any_of(candidate.consumed.begin(), candidate.consumed.end(),
                        [&](Position p) { return claimed[indexOf(p)]; });
        if (contested) {
            continue;
        }

        claimed[indexOf(candidate.origin)] = true;
        for (const auto& p : candidate.consumed) {
            claimed[indexOf(p)] = true;
        }
        result.push_back(std::move(candidate));
    }

    return result;
}

std::vector<Match> uniqueMatches(const Board& board)
{
    return claimDisjoint(scanAllMatches(board), board.size());
}

} // namespace tilematch::core
