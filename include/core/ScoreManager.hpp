#pragma once

#include <cstdint>

namespace tilematch::core {

class ScoreManager {
public:
    // Points come from upgrade snapshots; raises the high score when beaten.
    void addPoints(std::uint64_t points) noexcept;

    std::uint64_t score() const noexcept { return score_; }
    std::uint64_t highscore() const noexcept { return highscore_; }

    // Used when restoring a saved game or a stored high score.
    void setScore(std::uint64_t score) noexcept;
    void setHighscore(std::uint64_t highscore) noexcept { highscore_ = highscore; }

    // Clears the current score only; the high score survives new games.
    void reset() noexcept { score_ = 0; }

private:
    std::uint64_t score_{0};
    std::uint64_t highscore_{0};
};

} // namespace tilematch::core
