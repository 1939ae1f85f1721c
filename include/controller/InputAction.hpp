#pragma once

namespace tilematch::controller {

// Discrete player input actions.
// These are UI- and platform-agnostic: keyboard, mouse, touch, etc.
enum class InputAction {
    CursorUp,
    CursorDown,
    CursorLeft,
    CursorRight,
    Select,     // tap the tile under the cursor
    SwipeUp,    // swipe from the cursor tile
    SwipeDown,
    SwipeLeft,
    SwipeRight,
    Hint,
    NewGame
};

} // namespace tilematch::controller
