#include <catch2/catch.hpp>

#include "core/ScoreManager.hpp"

using namespace tilematch::core;

TEST_CASE("ScoreManager accumulates points and tracks the best score", "[score]") {
    ScoreManager s;

    SECTION("Zero points change nothing") {
        s.addPoints(0);
        REQUIRE(s.score() == 0);
        REQUIRE(s.highscore() == 0);
    }

    SECTION("Points add up and raise the high score") {
        s.addPoints(16);
        s.addPoints(4);
        REQUIRE(s.score() == 20);
        REQUIRE(s.highscore() == 20);
    }

    SECTION("Reset keeps the high score") {
        s.addPoints(64);
        s.reset();
        REQUIRE(s.score() == 0);
        REQUIRE(s.highscore() == 64);

        s.addPoints(8);
        REQUIRE(s.score() == 8);
        REQUIRE(s.highscore() == 64); // not beaten yet
    }

    SECTION("A stored high score is only beaten by a better game") {
        s.setHighscore(1000);
        s.addPoints(512);
        REQUIRE(s.highscore() == 1000);
        s.addPoints(1024);
        REQUIRE(s.highscore() == 1536);
    }

    SECTION("Restoring a score counts towards the high score") {
        s.setScore(300);
        REQUIRE(s.score() == 300);
        REQUIRE(s.highscore() == 300);
    }
}
