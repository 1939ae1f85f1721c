#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/Board.hpp"
#include "core/TileSource.hpp"

namespace tilematch::persist {

// Transport form of a game. Only values survive: tile ids and consumed
// state are minted fresh on load.
struct SavedGame {
    int size{};
    std::uint64_t points{};
    std::uint32_t moves{};
    std::vector<int> values; // index = y*size + x
};

/// Serialize a SavedGame into a single line of text (without trailing '\n'):
/// GAME;<size>;<points>;<moves>;<v0>,<v1>,...
std::string serialize(const SavedGame& game);

/// Parse a SavedGame from a single line of text.
/// Returns std::nullopt on parse error or inconsistent contents.
std::optional<SavedGame> deserialize(const std::string& line);

SavedGame toSavedGame(const tilematch::core::Board& board, std::uint64_t points,
                      std::uint32_t moves);

/// Rebuild a board from saved values, taking fresh tile ids from `source`.
/// Expects a SavedGame that passed deserialize() (or came from toSavedGame()).
tilematch::core::Board toBoard(const SavedGame& game, tilematch::core::ITileSource& source);

} // namespace tilematch::persist
