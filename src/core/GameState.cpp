#include "core/GameState.hpp"
#include "core/BoardGenerator.hpp"
#include <stdexcept>

namespace tilematch::core {

GameState::GameState(int size)
    : source_{}
    , board_{generateBoard(size, source_)}
    , scoreManager_{}
    , status_{GameStatus::NotStarted}
{
}

GameState::GameState(int size, std::uint32_t seed)
    : source_{seed}
    , board_{generateBoard(size, source_)}
    , scoreManager_{}
    , status_{GameStatus::NotStarted}
{
}

void GameState::start() {
    if (status_ == GameStatus::Running) return;

    // A finished game is dealt a new board; otherwise play the one already dealt.
    if (status_ == GameStatus::GameOver) {
        reset();
    }

    status_ = GameStatus::Running;
    refreshStatus();
}

void GameState::reset() {
    board_ = generateBoard(board_.size(), source_);
    scoreManager_.reset();
    moves_ = 0;
    reached2048_ = false;
    lastSequence_.clear();
    status_ = GameStatus::NotStarted;
}

void GameState::restore(const Board& board, std::uint64_t points, std::uint32_t moves) {
    if (board.size() != board_.size()) {
        throw std::invalid_argument("GameState::restore board size mismatch");
    }

    board_ = board;
    scoreManager_.setScore(points);
    moves_ = moves;
    reached2048_ = containsValue(board_, Value2048);
    lastSequence_.clear();

    status_ = GameStatus::Running;
    refreshStatus();
}

const std::vector<BoardSnapshot>& GameState::swap(Position from, Position to) {
    lastSequence_.clear();
    if (status_ != GameStatus::Running) {
        return lastSequence_;
    }

    lastSequence_ = resolveSwap(from, to, board_, source_);
    ++moves_;

    for (const auto& step : lastSequence_) {
        scoreManager_.addPoints(step.points);
    }
    board_ = lastSequence_.back().board;

    if (containsValue(board_, Value2048)) {
        reached2048_ = true;
    }

    refreshStatus();
    return lastSequence_;
}

std::optional<std::pair<Position, Position>> GameState::hint() const {
    return findAlmostMatch(board_);
}

void GameState::refreshStatus() {
    if (status_ == GameStatus::Running && isTerminal(board_)) {
        status_ = GameStatus::GameOver;
    }
}

} // namespace tilematch::core
