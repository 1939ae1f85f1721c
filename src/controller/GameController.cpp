#include "controller/GameController.hpp"
#include "core/BoardQueries.hpp"
#include <algorithm>

namespace tilematch::controller {

GameController::GameController(tilematch::core::GameState& game)
    : game_{game}
{
}

bool GameController::handleAction(InputAction action) {
    using core::GameStatus;

    if (action == InputAction::NewGame) {
        game_.reset();
        game_.start();
        cursor_ = Position{0, 0};
        selected_.reset();
        hint_.reset();
        return false;
    }

    switch (action) {
    case InputAction::CursorUp:
        moveCursor(0, -1);
        break;
    case InputAction::CursorDown:
        moveCursor(0, 1);
        break;
    case InputAction::CursorLeft:
        moveCursor(-1, 0);
        break;
    case InputAction::CursorRight:
        moveCursor(1, 0);
        break;
    case InputAction::Select:
        return tap(cursor_);
    case InputAction::SwipeUp:
        return swipe(cursor_, 0, -1);
    case InputAction::SwipeDown:
        return swipe(cursor_, 0, 1);
    case InputAction::SwipeLeft:
        return swipe(cursor_, -1, 0);
    case InputAction::SwipeRight:
        return swipe(cursor_, 1, 0);
    case InputAction::Hint:
        if (game_.status() == GameStatus::Running) {
            hint_ = game_.hint();
        }
        break;
    case InputAction::NewGame:
        break;
    }
    return false;
}

bool GameController::tap(Position position) {
    if (!selected_) {
        selected_ = position;
        return false;
    }

    const Position from = *selected_;
    selected_.reset();

    if (from == position || !core::areAdjacent(from, position)) {
        return false;
    }

    return performSwap(from, position);
}

bool GameController::swipe(Position position, int dx, int dy) {
    selected_.reset();
    return performSwap(position, Position{position.x + dx, position.y + dy});
}

void GameController::moveCursor(int dx, int dy) {
    const int last = game_.size() - 1;
    cursor_.x = std::clamp(cursor_.x + dx, 0, last);
    cursor_.y = std::clamp(cursor_.y + dy, 0, last);
}

bool GameController::performSwap(Position from, Position to) {
    if (game_.status() != core::GameStatus::Running) {
        return false;
    }

    hint_.reset();
    game_.swap(from, to);
    return true;
}

} // namespace tilematch::controller
