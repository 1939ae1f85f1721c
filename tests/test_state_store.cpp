#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

#include "persist/StateStore.hpp"

using namespace tilematch::persist;
namespace fs = std::filesystem;

namespace {
    // Fresh directory under the system temp dir, removed at scope exit.
    struct TempDir {
        fs::path path;

        TempDir()
            : path{fs::temp_directory_path() /
                   ("tilematch_test_" + std::to_string(std::random_device{}()))}
        {
        }

        ~TempDir() {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
    };
}

TEST_CASE("StateStore: empty store has nothing saved", "[persist][store]") {
    TempDir dir;
    StateStore store{dir.path / "state"};

    CHECK_FALSE(store.load("anything").has_value());
    CHECK_FALSE(store.loadGame().has_value());
    CHECK(store.highscore() == 0);
    CHECK_FALSE(store.hasAchievement());
}

TEST_CASE("StateStore: values survive a new store instance", "[persist][store]") {
    TempDir dir;

    {
        StateStore store{dir.path};
        REQUIRE(store.save("doneTutorial", "true"));
        REQUIRE(store.setHighscore(4096));
        REQUIRE(store.markAchievement());

        SavedGame game;
        game.size = 2;
        game.points = 64;
        game.moves = 3;
        game.values = {1, 2, 3, 4};
        REQUIRE(store.saveGame(game));
    }

    StateStore reopened{dir.path};
    CHECK(reopened.load("doneTutorial") == std::optional<std::string>{"true"});
    CHECK(reopened.highscore() == 4096);
    CHECK(reopened.hasAchievement());

    const auto game = reopened.loadGame();
    REQUIRE(game.has_value());
    CHECK(game->size == 2);
    CHECK(game->points == 64u);
    CHECK(game->moves == 3u);
    CHECK(game->values == std::vector<int>{1, 2, 3, 4});
}

TEST_CASE("StateStore: corrupt entries read as missing", "[persist][store]") {
    TempDir dir;
    fs::create_directories(dir.path);

    {
        std::ofstream(dir.path / "gameState") << "GAME;3;oops\n";
        std::ofstream(dir.path / "highscore") << "lots\n";
    }

    StateStore store{dir.path};
    CHECK_FALSE(store.loadGame().has_value());
    CHECK(store.highscore() == 0);
}

TEST_CASE("StateStore: saving overwrites the previous value", "[persist][store]") {
    TempDir dir;
    StateStore store{dir.path};

    REQUIRE(store.setHighscore(10));
    REQUIRE(store.setHighscore(20));
    CHECK(store.highscore() == 20);
}
