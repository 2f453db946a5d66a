#include <catch2/catch_test_macros.hpp>
#include "crossfill/puzzle.hpp"
#include <stdexcept>
#include <algorithm>

using namespace crossfill;

// ============================================================================
// Slot tests
// ============================================================================

TEST_CASE("Slot cells", "[puzzle][slot]") {
    Slot across{1, 2, Direction::Across, 3};
    Slot down{0, 4, Direction::Down, 2};

    REQUIRE(across.cells() == std::vector<Cell>{{1, 2}, {1, 3}, {1, 4}});
    REQUIRE(down.cells() == std::vector<Cell>{{0, 4}, {1, 4}});
    REQUIRE(across.name() == "(1,2) across 3");
    REQUIRE(down.name() == "(0,4) down 2");
}

// ============================================================================
// Puzzle from slots
// ============================================================================

TEST_CASE("Puzzle overlaps and neighbors", "[puzzle]") {
    // H1: row 0, cols 0-2 / D: col 1, rows 0-2 / H2: row 2, cols 1-3
    Puzzle puzzle({{0, 0, Direction::Across, 3},
                   {0, 1, Direction::Down, 3},
                   {2, 1, Direction::Across, 3}},
                  Vocabulary({"CAT", "CAR", "ART", "TAR"}));

    REQUIRE(puzzle.slot_count() == 3);
    REQUIRE(puzzle.height() == 3);
    REQUIRE(puzzle.width() == 4);

    SECTION("overlap offsets are mirrored") {
        REQUIRE(puzzle.overlap(0, 1) == Overlap{1, 0});
        REQUIRE(puzzle.overlap(1, 0) == Overlap{0, 1});
        REQUIRE(puzzle.overlap(1, 2) == Overlap{2, 0});
        REQUIRE(puzzle.overlap(2, 1) == Overlap{0, 2});
    }

    SECTION("no overlap") {
        REQUIRE(!puzzle.overlap(0, 2).has_value());
        REQUIRE(!puzzle.overlap(2, 0).has_value());
        REQUIRE(!puzzle.overlap(1, 1).has_value());
    }

    SECTION("neighbors and degree") {
        REQUIRE(puzzle.neighbors(0) == std::vector<SlotId>{1});
        REQUIRE(puzzle.neighbors(1) == std::vector<SlotId>{0, 2});
        REQUIRE(puzzle.neighbors(2) == std::vector<SlotId>{1});
        REQUIRE(puzzle.degree(1) == 2);
    }

    SECTION("arcs") {
        std::vector<Arc> expected{{0, 1}, {1, 0}, {1, 2}, {2, 1}};
        REQUIRE(puzzle.arcs() == expected);
    }

    SECTION("open cells") {
        REQUIRE(puzzle.is_open(0, 0));
        REQUIRE(puzzle.is_open(1, 1));
        REQUIRE(!puzzle.is_open(1, 0));
        REQUIRE(!puzzle.is_open(0, 3));
        REQUIRE(!puzzle.is_open(10, 10));
    }

    SECTION("slot lookup") {
        REQUIRE(puzzle.slot(1).direction == Direction::Down);
        REQUIRE(puzzle.length(2) == 3);
        REQUIRE_THROWS_AS(puzzle.slot(3), std::out_of_range);
    }
}

TEST_CASE("Puzzle rejects malformed geometry", "[puzzle]") {
    SECTION("zero length slot") {
        REQUIRE_THROWS_AS(Puzzle({{0, 0, Direction::Across, 0}}, Vocabulary()),
                          std::invalid_argument);
    }

    SECTION("slots sharing two cells") {
        REQUIRE_THROWS_AS(Puzzle({{0, 0, Direction::Across, 3},
                                  {0, 1, Direction::Across, 3}}, Vocabulary()),
                          std::invalid_argument);
    }
}

TEST_CASE("Puzzle parallel slots sharing one cell are neighbors", "[puzzle]") {
    Puzzle puzzle({{0, 0, Direction::Across, 3},
                   {0, 2, Direction::Across, 2}}, Vocabulary());

    REQUIRE(puzzle.overlap(0, 1) == Overlap{2, 0});
    REQUIRE(puzzle.degree(0) == 1);
}

// ============================================================================
// Puzzle from grid
// ============================================================================

TEST_CASE("Puzzle from_grid extracts slots", "[puzzle][grid]") {
    // ___#
    // #_##
    // #___
    std::vector<std::vector<bool>> open{
        {true, true, true, false},
        {false, true, false, false},
        {false, true, true, true},
    };
    auto puzzle = Puzzle::from_grid(open, Vocabulary({"CAT"}));

    REQUIRE(puzzle.slot_count() == 3);
    REQUIRE(puzzle.slot(0) == Slot{0, 0, Direction::Across, 3});
    REQUIRE(puzzle.slot(1) == Slot{0, 1, Direction::Down, 3});
    REQUIRE(puzzle.slot(2) == Slot{2, 1, Direction::Across, 3});
    REQUIRE(puzzle.height() == 3);
    REQUIRE(puzzle.width() == 4);
}

TEST_CASE("Puzzle from_grid ignores single cells and pads short rows", "[puzzle][grid]") {
    // _#_
    // __
    // _
    std::vector<std::vector<bool>> open{
        {true, false, true},
        {true, true},
        {true},
    };
    auto puzzle = Puzzle::from_grid(open, Vocabulary());

    REQUIRE(puzzle.width() == 3);
    REQUIRE(!puzzle.is_open(1, 2));

    // (0,0) down 3 と (1,0) across 2 のみ（(0,2) は1マス）
    REQUIRE(puzzle.slot_count() == 2);
    REQUIRE(puzzle.slot(0) == Slot{0, 0, Direction::Down, 3});
    REQUIRE(puzzle.slot(1) == Slot{1, 0, Direction::Across, 2});
    REQUIRE(puzzle.overlap(0, 1) == Overlap{1, 0});
}

TEST_CASE("Puzzle from_grid on empty grid", "[puzzle][grid]") {
    auto puzzle = Puzzle::from_grid({}, Vocabulary({"A"}));
    REQUIRE(puzzle.slot_count() == 0);
    REQUIRE(puzzle.arcs().empty());
}
