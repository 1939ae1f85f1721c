#include "persist/StateStore.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>

namespace tilematch::persist {

namespace {
    constexpr const char* GameKey        = "gameState";
    constexpr const char* HighscoreKey   = "highscore";
    constexpr const char* AchievementKey = "2048achievement";
}

StateStore::StateStore(std::filesystem::path directory)
    : directory_{std::move(directory)}
{
}

std::filesystem::path StateStore::pathFor(const std::string& key) const {
    return directory_ / key;
}

bool StateStore::save(const std::string& key, const std::string& value) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        std::cerr << "StateStore: cannot create " << directory_ << ": " << ec.message() << "\n";
        return false;
    }

    std::ofstream out(pathFor(key), std::ios::trunc);
    if (!out) {
        std::cerr << "StateStore: cannot open " << pathFor(key) << " for writing\n";
        return false;
    }
    out << value << '\n';
    if (!out) {
        std::cerr << "StateStore: write failed for key '" << key << "'\n";
        return false;
    }
    return true;
}

std::optional<std::string> StateStore::load(const std::string& key) const {
    std::ifstream in(pathFor(key));
    if (!in) {
        return std::nullopt; // never saved
    }

    std::string value;
    if (!std::getline(in, value)) {
        std::cerr << "StateStore: empty or unreadable key '" << key << "'\n";
        return std::nullopt;
    }
    return value;
}

bool StateStore::saveGame(const SavedGame& game) {
    return save(GameKey, serialize(game));
}

std::optional<SavedGame> StateStore::loadGame() const {
    auto line = load(GameKey);
    if (!line) {
        return std::nullopt;
    }

    auto game = deserialize(*line);
    if (!game) {
        std::cerr << "StateStore: ignoring corrupt saved game\n";
    }
    return game;
}

std::uint64_t StateStore::highscore() const {
    auto value = load(HighscoreKey);
    if (!value) {
        return 0;
    }

    try {
        return std::stoull(*value);
    } catch (const std::exception& e) {
        std::cerr << "StateStore: bad highscore '" << *value << "': " << e.what() << "\n";
        return 0;
    }
}

bool StateStore::setHighscore(std::uint64_t highscore) {
    return save(HighscoreKey, std::to_string(highscore));
}

bool StateStore::markAchievement() {
    return save(AchievementKey, "true");
}

bool StateStore::hasAchievement() const {
    auto value = load(AchievementKey);
    return value && *value == "true";
}

} // namespace tilematch::persist
