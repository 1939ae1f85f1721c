#include "persist/Serialization.hpp"

#include <sstream>
#include <stdexcept>

namespace tilematch::persist {

using tilematch::core::Board;
using tilematch::core::Position;

namespace {
    constexpr const char* Tag = "GAME";

    // std::stoull and friends accept leading blanks and signs; a saved game
    // never contains them.
    bool isDigits(const std::string& s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }
}

std::string serialize(const SavedGame& game)
{
    std::ostringstream os;
    os << Tag << ';' << game.size << ';' << game.points << ';' << game.moves << ';';

    for (std::size_t i = 0; i < game.values.size(); ++i) {
        if (i > 0) {
            os << ',';
        }
        os << game.values[i];
    }

    return os.str();
}

std::optional<SavedGame> deserialize(const std::string& line)
{
    std::istringstream is(line);
    std::string type, sizeStr, pointsStr, movesStr, valuesStr;

    if (!std::getline(is, type, ';') || type != Tag) return std::nullopt;
    if (!std::getline(is, sizeStr, ';')) return std::nullopt;
    if (!std::getline(is, pointsStr, ';')) return std::nullopt;
    if (!std::getline(is, movesStr, ';')) return std::nullopt;
    if (!std::getline(is, valuesStr)) return std::nullopt;

    if (!isDigits(sizeStr) || !isDigits(pointsStr) || !isDigits(movesStr)) {
        return std::nullopt;
    }

    SavedGame game;
    try {
        game.size = std::stoi(sizeStr);
        game.points = std::stoull(pointsStr);
        const unsigned long moves = std::stoul(movesStr);
        if (moves > UINT32_MAX) return std::nullopt;
        game.moves = static_cast<std::uint32_t>(moves);

        std::istringstream vs(valuesStr);
        std::string item;
        while (std::getline(vs, item, ',')) {
            if (!isDigits(item)) return std::nullopt;
            game.values.push_back(std::stoi(item));
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }

    if (game.size <= 0) return std::nullopt;
    if (game.values.size() != static_cast<std::size_t>(game.size) * game.size) {
        return std::nullopt;
    }
    for (int v : game.values) {
        if (v < 1 || v > core::MaxTileValue) return std::nullopt;
    }

    return game;
}

SavedGame toSavedGame(const Board& board, std::uint64_t points, std::uint32_t moves)
{
    SavedGame game;
    game.size = board.size();
    game.points = points;
    game.moves = moves;
    game.values.resize(static_cast<std::size_t>(game.size) * game.size);

    for (int x = 0; x < game.size; ++x) {
        for (int y = 0; y < game.size; ++y) {
            const Position p{x, y};
            game.values[board.positionToIndex(p)] = board.tileAt(p).value;
        }
    }

    return game;
}

Board toBoard(const SavedGame& game, tilematch::core::ITileSource& source)
{
    if (game.values.size() != static_cast<std::size_t>(game.size) * game.size) {
        throw std::invalid_argument("toBoard: value count does not match size");
    }

    Board board{game.size};

    for (int index = 0; index < game.size * game.size; ++index) {
        const Position p = board.indexToPosition(index);
        board.setTile(p, source.nextTile().withValue(game.values[index]));
    }

    return board;
}

} // namespace tilematch::persist
