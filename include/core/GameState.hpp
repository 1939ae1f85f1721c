#pragma once

#include "Board.hpp"
#include "BoardQueries.hpp"
#include "MoveResolver.hpp"
#include "ScoreManager.hpp"
#include "TileSource.hpp"
#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace tilematch::core {

enum class GameStatus {
    NotStarted,
    Running,
    GameOver
};

// One game session: board, points, move count and status.
// The engine functions are stateless; this class owns what changes between moves.
class GameState {
public:
    explicit GameState(int size = 8);
    GameState(int size, std::uint32_t seed);

    const Board& board() const noexcept { return board_; }
    int size() const noexcept { return board_.size(); }

    std::uint64_t points() const noexcept { return scoreManager_.score(); }
    std::uint64_t highscore() const noexcept { return scoreManager_.highscore(); }
    std::uint32_t moves() const noexcept { return moves_; }
    GameStatus status() const noexcept { return status_; }
    bool reached2048() const noexcept { return reached2048_; }

    // Sequence produced by the last swap(), for playback.
    const std::vector<BoardSnapshot>& lastSequence() const noexcept { return lastSequence_; }

    // Control API for the controller / input layer
    void start();
    void reset();

    // Adopt a loaded game. Throws std::invalid_argument on size mismatch.
    void restore(const Board& board, std::uint64_t points, std::uint32_t moves);

    void setHighscore(std::uint64_t highscore) noexcept { scoreManager_.setHighscore(highscore); }

    // Resolves the swap and applies the whole sequence. Every attempt counts
    // as a move, rejected ones included. Ignored unless Running.
    const std::vector<BoardSnapshot>& swap(Position from, Position to);

    // Pair to highlight; the swap is not executed.
    std::optional<std::pair<Position, Position>> hint() const;

    bool isGameOver() const noexcept { return status_ == GameStatus::GameOver; }

private:
    RandomTileSource source_;
    Board board_;
    ScoreManager scoreManager_;
    std::uint32_t moves_{0};
    GameStatus status_{GameStatus::NotStarted};
    bool reached2048_{false};
    std::vector<BoardSnapshot> lastSequence_;

    void refreshStatus();
};

} // namespace tilematch::core
