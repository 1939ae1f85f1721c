#include <catch2/catch.hpp>

#include <stdexcept>

#include "core/BoardQueries.hpp"
#include "core/BoardScanner.hpp"
#include "core/GameState.hpp"
#include "FakeTileSource.hpp"

using namespace tilematch::core;

namespace {
    Board rowOfValues(int v) {
        return boardFromRows({
            {1, 2, v, 4},
            {v, v, 1, 2},
            {2, 1, 4, 1},
            {4, 2, 1, 3},
        });
    }

    Board terminalBoard() {
        return boardFromRows({
            {1, 2, 3, 4},
            {3, 4, 1, 2},
            {1, 2, 3, 4},
            {3, 4, 1, 2},
        });
    }
}

TEST_CASE("GameState starts with a clean board", "[gamestate]") {
    GameState game{8, 5u};

    REQUIRE(game.status() == GameStatus::NotStarted);
    REQUIRE(game.size() == 8);

    game.start();

    REQUIRE((game.status() == GameStatus::Running || game.status() == GameStatus::GameOver));
    CHECK(game.points() == 0);
    CHECK(game.moves() == 0);
    CHECK(uniqueMatches(game.board()).empty());
    CHECK(game.lastSequence().empty());
}

TEST_CASE("GameState start plays the board already dealt", "[gamestate]") {
    GameState game{4, 7u};
    const Board dealt = game.board();

    game.start();
    CHECK(game.board() == dealt);

    game.reset();
    const Board redealt = game.board();
    CHECK(redealt != dealt);

    game.start();
    CHECK(game.board() == redealt);
}

TEST_CASE("GameState start after game over deals a fresh board", "[gamestate][gameover]") {
    GameState game{4, 9u};
    game.restore(terminalBoard(), 100, 7);
    REQUIRE(game.status() == GameStatus::GameOver);

    game.start();

    CHECK((game.status() == GameStatus::Running || game.status() == GameStatus::GameOver));
    CHECK(game.points() == 0);
    CHECK(game.moves() == 0);
    CHECK(game.board() != terminalBoard());
    CHECK(uniqueMatches(game.board()).empty());
}

TEST_CASE("GameState ignores swaps before start", "[gamestate]") {
    GameState game{4, 1u};

    const auto& seq = game.swap(Position{0, 0}, Position{1, 0});
    CHECK(seq.empty());
    CHECK(game.moves() == 0);
}

TEST_CASE("GameState applies a resolved swap", "[gamestate]") {
    GameState game{4, 11u};
    game.restore(rowOfValues(3), 0, 0);
    REQUIRE(game.status() == GameStatus::Running);

    const auto& seq = game.swap(Position{2, 0}, Position{2, 1});

    REQUIRE(seq.size() >= 4);
    CHECK(game.moves() == 1);
    CHECK(game.points() >= 16);
    CHECK(game.highscore() == game.points());
    CHECK(game.board() == seq.back().board);
    CHECK(uniqueMatches(game.board()).empty());

    std::uint64_t total = 0;
    for (const auto& step : seq) {
        total += step.points;
    }
    CHECK(game.points() == total);
}

TEST_CASE("GameState counts rejected swaps as moves", "[gamestate]") {
    GameState game{4, 3u};
    const Board start = rowOfValues(3);
    game.restore(start, 40, 2);

    const auto& seq = game.swap(Position{0, 0}, Position{1, 0});

    CHECK(seq.size() == 2);
    CHECK(game.moves() == 3);
    CHECK(game.points() == 40);
    CHECK(game.board() == start);

    // Off-board swipes count too; the board stays put
    game.swap(Position{3, 3}, Position{4, 3});
    CHECK(game.moves() == 4);
    CHECK(game.board() == start);
}

TEST_CASE("GameState reports game over on a terminal board", "[gamestate][gameover]") {
    GameState game{4, 8u};
    game.restore(terminalBoard(), 100, 7);

    CHECK(game.status() == GameStatus::GameOver);
    CHECK(game.isGameOver());
    CHECK_FALSE(game.hint().has_value());

    CHECK(game.swap(Position{0, 0}, Position{1, 0}).empty());
    CHECK(game.moves() == 7);
}

TEST_CASE("GameState notices the 2048 tile", "[gamestate]") {
    GameState game{4, 21u};
    game.restore(rowOfValues(10), 0, 0);
    REQUIRE_FALSE(game.reached2048());

    const auto& seq = game.swap(Position{2, 0}, Position{2, 1});
    REQUIRE(seq.size() >= 4);
    CHECK(seq[2].points == 2048);
    CHECK(game.reached2048());
}

TEST_CASE("GameState hint does not move anything", "[gamestate][hint]") {
    GameState game{4, 2u};
    const Board start = rowOfValues(3);
    game.restore(start, 0, 0);

    const auto hint = game.hint();
    REQUIRE(hint.has_value());
    CHECK(*hint == *findAlmostMatch(start));
    CHECK(game.board() == start);
    CHECK(game.moves() == 0);
}

TEST_CASE("GameState reset keeps the high score", "[gamestate]") {
    GameState game{4, 13u};
    game.setHighscore(500);
    game.restore(rowOfValues(3), 700, 9);
    REQUIRE(game.highscore() == 700);

    game.reset();

    CHECK(game.status() == GameStatus::NotStarted);
    CHECK(game.points() == 0);
    CHECK(game.moves() == 0);
    CHECK(game.highscore() == 700);
}

TEST_CASE("GameState refuses a restored board of another size", "[gamestate]") {
    GameState game{8, 4u};
    CHECK_THROWS_AS(game.restore(rowOfValues(3), 0, 0), std::invalid_argument);
}
