#pragma once

#include "core/GameState.hpp"
#include "controller/InputAction.hpp"
#include <optional>
#include <utility>

namespace tilematch::controller {

class GameController {
public:
    using Position = tilematch::core::Position;

    /// Controller does not own the GameState; caller keeps it alive.
    explicit GameController(tilematch::core::GameState& game);

    /// Handle a single discrete player action (e.g. key press).
    /// Returns true if the action triggered a swap; the resolved sequence is
    /// then available from GameState::lastSequence().
    bool handleAction(InputAction action);

    Position cursor() const noexcept { return cursor_; }
    const std::optional<Position>& selected() const noexcept { return selected_; }
    const std::optional<std::pair<Position, Position>>& hint() const noexcept { return hint_; }

    // Tap on a tile: first tap selects, a tap on an adjacent tile swaps,
    // any other tap clears the selection.
    bool tap(Position position);

    // Swipe from `position` one step towards (dx, dy). The target may lie off
    // the board; the resolver turns that into a no-op.
    bool swipe(Position position, int dx, int dy);

private:
    tilematch::core::GameState& game_;
    Position cursor_{0, 0};
    std::optional<Position> selected_;
    std::optional<std::pair<Position, Position>> hint_;

    void moveCursor(int dx, int dy);
    bool performSwap(Position from, Position to);
};

} // namespace tilematch::controller
