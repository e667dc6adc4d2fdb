/**
 * @file test_session.cpp
 * @brief Integration tests: JSON programs replayed through a session
 *
 * Programs go through loadProgram -> CommandTable -> Canvas -> toJson, the
 * same path the turtle CLI takes.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <turtle/turtle.h>

using namespace turtle;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

static size_t countTokens(const std::string& seq, char op) {
    size_t n = 0;
    for (size_t i = 0; i < seq.size(); ++i) {
        bool atStart = (i == 0 || seq[i - 1] == ' ');
        if (atStart && seq[i] == op) ++n;
    }
    return n;
}

static const char* SQUARE_PROGRAM = R"([
    ["bgcolor", "Black"],
    ["color", "Yellow"],
    ["rt", 90],
    ["fd", 100], ["rt", 90],
    ["fd", 100], ["rt", 90],
    ["fd", 100], ["rt", 90],
    ["fd", 100], ["rt", 90],
    ["pu"],
    ["goto", 200, 200],
    ["pd"],
    ["fd", 10]
])";

TEST_CASE("Program replay produces a drawing", "[integration][session]") {
    Session session("square");
    Canvas canvas(session);
    CommandTable commands(canvas);

    auto program = loadProgram(json::parse(SQUARE_PROGRAM));
    REQUIRE(runProgram(commands, program) == program.size());

    json out = toJson(canvas.exportDrawing());

    SECTION("background and move styles") {
        REQUIRE(out["bgColor"] == "black");
        REQUIRE(out["path"].size() == 2);
        REQUIRE(out["path"][0]["seq"] == "M 0 0");
        REQUIRE(out["path"][0]["stroke"] == "black");
        REQUIRE(out["path"][1]["stroke"] == "yellow");
        REQUIRE(out["path"][1]["fill"] == "transparent");
    }

    SECTION("square then a detached segment") {
        std::string seq = out["path"][1]["seq"].get<std::string>();
        REQUIRE(seq.rfind("M 0 0 L 100 0 ", 0) == 0);
        REQUIRE(countTokens(seq, 'L') == 5);
        REQUIRE(countTokens(seq, 'M') == 2);
        REQUIRE(seq.find("M 200 200 L 210 200") != std::string::npos);
    }

    SECTION("final turtle state") {
        REQUIRE_THAT(canvas.x(), WithinAbs(210.0, 1e-9));
        REQUIRE_THAT(canvas.y(), WithinAbs(200.0, 1e-9));
        REQUIRE(canvas.angle() == 0.0);
        REQUIRE(canvas.isPenDown());
    }
}

TEST_CASE("Program replay stops at the first failure", "[integration][session]") {
    Session session;
    Canvas canvas(session);
    CommandTable commands(canvas);

    auto program = loadProgram(json::parse(R"([
        ["fd", 10],
        ["color", "not-a-color"],
        ["fd", 10]
    ])"));

    REQUIRE_THROWS_AS(runProgram(commands, program), InvalidColorError);
    REQUIRE(canvas.moves().size() == 1);
    REQUIRE(countTokens(canvas.activeMove().pathString(), 'L') == 1);
}

TEST_CASE("Fragile session rejects replayed drawing", "[integration][fragile]") {
    Session session;
    Canvas canvas(session);
    CommandTable commands(canvas);

    commands.execute("fd", {50.0});
    json before = toJson(canvas.exportDrawing());

    auto program = loadProgram(json::parse(SQUARE_PROGRAM));
    {
        Session::FragileScope replay(session);
        REQUIRE_THROWS_AS(runProgram(commands, program), IrreversibleOperationError);
        REQUIRE(toJson(canvas.exportDrawing()) == before);
    }

    REQUIRE(runProgram(commands, program) == program.size());
    REQUIRE(toJson(canvas.exportDrawing()) != before);
}

TEST_CASE("Independent sessions do not share state", "[integration][session]") {
    Session first("first");
    Session second("second");
    Canvas a(first);
    Canvas b(second);

    first.setFragile(true);
    REQUIRE_THROWS_AS(a.forward(10), IrreversibleOperationError);
    b.forward(10);

    REQUIRE(a.activeMove().pathString() == "M 0 0");
    REQUIRE(countTokens(b.activeMove().pathString(), 'L') == 1);
    REQUIRE(b.session().name() == "second");
}
