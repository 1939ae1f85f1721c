#include "core/Board.hpp"
#include <stdexcept>
#include <string>

namespace tilematch::core {

Board::Board(int size)
    : size_{size}
    , tiles_{}
{
    if (size <= 0) {
        throw std::invalid_argument("Board size must be positive");
    }
    tiles_.resize(static_cast<std::size_t>(size) * static_cast<std::size_t>(size));
}

const Tile& Board::tileAt(Position p) const {
    if (!isInside(p)) {
        throw std::out_of_range("Board::tileAt out of range: x=" + std::to_string(p.x)
                                + " y=" + std::to_string(p.y));
    }
    return tiles_[storageIndex(p)];
}

void Board::setTile(Position p, const Tile& tile) {
    if (!isInside(p)) {
        throw std::out_of_range("Board::setTile out of range: x=" + std::to_string(p.x)
                                + " y=" + std::to_string(p.y));
    }
    tiles_[storageIndex(p)] = tile;
}

int Board::positionToIndex(Position p) const {
    if (!isInside(p)) {
        throw std::out_of_range("Board::positionToIndex out of range");
    }
    return p.y * size_ + p.x;
}

Position Board::indexToPosition(int index) const {
    if (index < 0 || index >= size_ * size_) {
        throw std::out_of_range("Board::indexToPosition out of range");
    }
    return Position{index % size_, index / size_};
}

bool Board::sameValues(const Board& other) const noexcept {
    if (size_ != other.size_) {
        return false;
    }
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        if (tiles_[i].value != other.tiles_[i].value) {
            return false;
        }
    }
    return true;
}

bool Board::operator==(const Board& other) const noexcept {
    return size_ == other.size_ && tiles_ == other.tiles_;
}

} // namespace tilematch::core
