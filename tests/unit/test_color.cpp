/**
 * @file test_color.cpp
 * @brief Unit tests for color resolution and RGB composition
 */

#include <catch2/catch_test_macros.hpp>
#include <turtle/color.h>
#include <turtle/errors.h>
#include <cmath>

using namespace turtle;

TEST_CASE("resolveColor accepts named colors", "[color]") {
    SECTION("names are lowercased") {
        REQUIRE(resolveColor("RED").str() == "red");
        REQUIRE(resolveColor("red").str() == "red");
        REQUIRE(resolveColor("RebeccaPurple").str() == "rebeccapurple");
    }

    SECTION("transparent is a valid name") {
        REQUIRE(resolveColor("Transparent") == Color::transparent());
    }

    SECTION("named colors are not expanded to hex") {
        Color c = resolveColor("White");
        REQUIRE(c.str() == "white");
        REQUIRE_FALSE(c.isHex());
    }
}

TEST_CASE("resolveColor accepts hex colors", "[color]") {
    SECTION("3 digit hex") {
        REQUIRE(resolveColor("#ABC").str() == "#abc");
    }

    SECTION("6 digit hex") {
        REQUIRE(resolveColor("#FF7F50").str() == "#ff7f50");
        REQUIRE(resolveColor("#ffffff") == Color::white());
        REQUIRE(resolveColor("#ffffff").isHex());
    }
}

TEST_CASE("resolveColor rejects invalid tokens", "[color]") {
    SECTION("unknown name") {
        REQUIRE_THROWS_AS(resolveColor("notacolor"), InvalidColorError);
    }

    SECTION("error carries the original token") {
        try {
            resolveColor("NotAColor");
            FAIL("expected InvalidColorError");
        } catch (const InvalidColorError& e) {
            REQUIRE(e.token() == "NotAColor");
            REQUIRE(e.kind() == ErrorKind::InvalidColor);
        }
    }

    SECTION("wrong hex lengths") {
        REQUIRE_THROWS_AS(resolveColor("#abcd"), InvalidColorError);
        REQUIRE_THROWS_AS(resolveColor("#ab"), InvalidColorError);
        REQUIRE_THROWS_AS(resolveColor("#aabbccdd"), InvalidColorError);
        REQUIRE_THROWS_AS(resolveColor("#"), InvalidColorError);
    }

    SECTION("non-hex digits and missing prefix") {
        REQUIRE_THROWS_AS(resolveColor("#12345g"), InvalidColorError);
        REQUIRE_THROWS_AS(resolveColor("ffffff"), InvalidColorError);
    }

    SECTION("surrounding whitespace is not trimmed") {
        REQUIRE_THROWS_AS(resolveColor(" red"), InvalidColorError);
        REQUIRE_THROWS_AS(resolveColor(""), InvalidColorError);
    }
}

TEST_CASE("rgbHex composes uppercase hex", "[color][rgb]") {
    SECTION("primary colors") {
        REQUIRE(rgbHex(1.0, 0.0, 0.0) == "#FF0000");
        REQUIRE(rgbHex(0.0, 1.0, 0.0) == "#00FF00");
        REQUIRE(rgbHex(0.0, 0.0, 1.0) == "#0000FF");
    }

    SECTION("components are truncated") {
        // 0.5 * 255 = 127.5
        REQUIRE(rgbHex(0.5, 0.5, 0.5) == "#7F7F7F");
        REQUIRE(rgbHex(0.0, 0.0, 0.0) == "#000000");
    }

    SECTION("result resolves to lowercase") {
        REQUIRE(resolveColor(rgbHex(1.0, 0.5, 0.0)).str() == "#ff7f00");
    }
}

TEST_CASE("rgbHex rejects out of range components", "[color][rgb]") {
    REQUIRE_THROWS_AS(rgbHex(1.1, 0.0, 0.0), DomainRangeError);
    REQUIRE_THROWS_AS(rgbHex(0.0, -0.01, 0.0), DomainRangeError);
    REQUIRE_THROWS_AS(rgbHex(0.0, 0.0, 2.0), DomainRangeError);
    REQUIRE_THROWS_AS(rgbHex(std::nan(""), 0.0, 0.0), DomainRangeError);
}

TEST_CASE("color predicates", "[color]") {
    REQUIRE(isNamedColor("aliceblue"));
    REQUIRE(isNamedColor("yellowgreen"));
    REQUIRE_FALSE(isNamedColor("Red"));
    REQUIRE(isHexColor("#a1B"));
    REQUIRE_FALSE(isHexColor("#a1"));
}

TEST_CASE("well-known colors", "[color]") {
    REQUIRE(Color::black().str() == "black");
    REQUIRE(Color::white().str() == "#ffffff");
    REQUIRE(Color::transparent().str() == "transparent");
    REQUIRE(&Color::white() == &Color::white());
}
