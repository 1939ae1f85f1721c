#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "core/Board.hpp"
#include "core/TileSource.hpp"

// Replays a fixed list of values, starting over when it runs out.
// Ids start at 1000 so spawned tiles are easy to tell from board tiles.
class FakeTileSource : public tilematch::core::ITileSource {
public:
    explicit FakeTileSource(std::vector<int> values)
        : values_{std::move(values)}
    {
    }

    int nextValue() override {
        const int v = values_[next_ % values_.size()];
        ++next_;
        return v;
    }

    tilematch::core::Tile nextTile() override {
        tilematch::core::Tile tile;
        tile.id = nextId_++;
        tile.value = nextValue();
        return tile;
    }

    std::size_t drawn() const noexcept { return next_; }

private:
    std::vector<int> values_;
    std::size_t next_{0};
    tilematch::core::TileId nextId_{1000};
};

/// Helper for tests: build a board from rows as they read on screen,
/// rows[y][x]. Tile ids are y*size + x + 1.
inline tilematch::core::Board boardFromRows(const std::vector<std::vector<int>>& rows) {
    using tilematch::core::Position;
    using tilematch::core::Tile;

    const int size = static_cast<int>(rows.size());
    tilematch::core::Board board{size};

    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            Tile tile;
            tile.id = static_cast<tilematch::core::TileId>(y * size + x + 1);
            tile.value = rows[y][x];
            board.setTile(Position{x, y}, tile);
        }
    }
    return board;
}

/// Values of a board as rows[y][x], for readable comparisons.
inline std::vector<std::vector<int>> rowsOf(const tilematch::core::Board& board) {
    const int size = board.size();
    std::vector<std::vector<int>> rows(size, std::vector<int>(size));
    for (int y = 0; y < size; ++y) {
        for (int x = 0; x < size; ++x) {
            rows[y][x] = board.tileAt(tilematch::core::Position{x, y}).value;
        }
    }
    return rows;
}
