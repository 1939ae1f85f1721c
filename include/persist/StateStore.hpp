#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "persist/Serialization.hpp"

namespace tilematch::persist {

/// Directory-backed key/value store, one file per key.
/// I/O problems are reported on std::cerr and never thrown: a game that
/// cannot be saved keeps running, a store that cannot be read looks empty.
class StateStore {
public:
    explicit StateStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const noexcept { return directory_; }

    bool save(const std::string& key, const std::string& value);
    std::optional<std::string> load(const std::string& key) const;

    bool saveGame(const SavedGame& game);
    // std::nullopt if nothing is stored or the stored line is corrupt.
    std::optional<SavedGame> loadGame() const;

    std::uint64_t highscore() const;
    bool setHighscore(std::uint64_t highscore);

    bool markAchievement();
    bool hasAchievement() const;

private:
    std::filesystem::path directory_;

    std::filesystem::path pathFor(const std::string& key) const;
};

} // namespace tilematch::persist
