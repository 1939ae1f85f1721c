#include "core/ScoreManager.hpp"

namespace tilematch::core {

void ScoreManager::addPoints(std::uint64_t points) noexcept {
    if (points == 0) return;

    score_ += points;
    if (score_ > highscore_) {
        highscore_ = score_;
    }
}

void ScoreManager::setScore(std::uint64_t score) noexcept {
    score_ = score;
    if (score_ > highscore_) {
        highscore_ = score_;
    }
}

} // namespace tilematch::core
