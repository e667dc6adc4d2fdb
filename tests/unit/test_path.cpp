/**
 * @file test_path.cpp
 * @brief Unit tests for path action formatting and Move export
 */

#include <catch2/catch_test_macros.hpp>
#include <turtle/move.h>
#include <turtle/path.h>

using namespace turtle;

TEST_CASE("formatNumber", "[path]") {
    SECTION("integral values have no fractional part") {
        REQUIRE(formatNumber(0.0) == "0");
        REQUIRE(formatNumber(100.0) == "100");
        REQUIRE(formatNumber(-100.0) == "-100");
    }

    SECTION("negative zero prints as zero") {
        REQUIRE(formatNumber(-0.0) == "0");
    }

    SECTION("fractions use shortest round-trip form") {
        REQUIRE(formatNumber(0.5) == "0.5");
        REQUIRE(formatNumber(0.1) == "0.1");
        REQUIRE(formatNumber(-12.25) == "-12.25");
    }
}

TEST_CASE("formatAction", "[path]") {
    REQUIRE(formatAction(PathAction::moveTo(0, 0)) == "M 0 0");
    REQUIRE(formatAction(PathAction::lineTo(10, -20.5)) == "L 10 -20.5");
    REQUIRE(formatAction(PathAction::closePath()) == "Z");
}

TEST_CASE("joinActions", "[path]") {
    REQUIRE(joinActions({}).empty());
    REQUIRE(joinActions({PathAction::moveTo(1, 2), PathAction::lineTo(3, 4), PathAction::closePath()})
            == "M 1 2 L 3 4 Z");
}

TEST_CASE("Move export", "[path][move]") {
    Move move(Color::black(), Color::transparent(), 1.0);

    SECTION("empty move has an empty path") {
        MoveExport out = move.exportMove();
        REQUIRE(out.seq.empty());
        REQUIRE(out.stroke == Color::black());
        REQUIRE(out.fill == Color::transparent());
        REQUIRE(move.thickness() == 1.0);
    }

    SECTION("actions are joined in emission order") {
        move.append(PathAction::moveTo(0, 0));
        move.append(PathAction::lineTo(5, 5));
        move.append(PathAction::moveTo(5, 5));
        REQUIRE(move.pathString() == "M 0 0 L 5 5 M 5 5");
        REQUIRE(move.actions().size() == 3);
    }
}
