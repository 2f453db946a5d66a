#include <catch2/catch_test_macros.hpp>
#include "crossfill/grid/options.hpp"
#include <stdexcept>
#include <vector>

using namespace crossfill::grid;

namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "crossfill");
    return parse_command_line(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("parse_command_line defaults", "[options]") {
    auto options = parse({"grid.txt", "words.txt"});

    REQUIRE(options.structure_file == "grid.txt");
    REQUIRE(options.words_file == "words.txt");
    REQUIRE(options.output_file.empty());
    REQUIRE(options.timeout_sec == 0);
    REQUIRE(options.lcv);
    REQUIRE(options.degree);
    REQUIRE(options.arc_consistency);
    REQUIRE(!options.print_stats);
    REQUIRE(!options.verbose);
}

TEST_CASE("parse_command_line flags", "[options]") {
    auto options = parse({"-s", "-v", "-t", "30", "--no-lcv", "--no-degree", "--no-ac",
                          "grid.txt", "words.txt", "out.png"});

    REQUIRE(options.print_stats);
    REQUIRE(options.verbose);
    REQUIRE(options.timeout_sec == 30);
    REQUIRE(!options.lcv);
    REQUIRE(!options.degree);
    REQUIRE(!options.arc_consistency);
    REQUIRE(options.output_file == "out.png");
}

TEST_CASE("parse_command_line help needs no files", "[options]") {
    REQUIRE(parse({"--help"}).show_help);
    REQUIRE(parse({"-h"}).show_help);
}

TEST_CASE("parse_command_line rejects bad timeouts", "[options]") {
    REQUIRE_THROWS_AS(parse({"-t", "abc", "grid.txt", "words.txt"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"-t", "0", "grid.txt", "words.txt"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"-t", "-5", "grid.txt", "words.txt"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"-t", "10s", "grid.txt", "words.txt"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"-t", "99999999999", "grid.txt", "words.txt"}), std::invalid_argument);
    REQUIRE_THROWS_AS(parse({"grid.txt", "words.txt", "-t"}), std::invalid_argument);
}

TEST_CASE("parse_command_line rejects bad arguments", "[options]") {
    SECTION("unknown option") {
        REQUIRE_THROWS_AS(parse({"--fast", "grid.txt", "words.txt"}), std::invalid_argument);
    }

    SECTION("missing words file") {
        REQUIRE_THROWS_AS(parse({"grid.txt"}), std::invalid_argument);
    }

    SECTION("too many files") {
        REQUIRE_THROWS_AS(parse({"a", "b", "c", "d"}), std::invalid_argument);
    }
}
