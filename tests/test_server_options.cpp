// Copyright © 2026 The Chipium Authors
//
// This file is part of Chipium.
//
// Chipium is free software: you can redistribute it and/or modify it under the terms of the
// GNU General Public License as published by the Free Software Foundation, either version 3 of the
// License, or (at your option) any later version. Chipium is distributed in the hope that it will
// be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more details.
// You should have received a copy of the GNU General Public License along with Chipium.
// If not, see <https://www.gnu.org/licenses/>.

#include <catch2/catch_test_macros.hpp>
#include <chipium/server/ServerOptions.hpp>

#include <stdexcept>
#include <vector>

using namespace chipium::server;

namespace {

ServerOptions parse(std::vector<const char*> args) {
    args.insert(args.begin(), "chipium-server");
    return parse_server_options(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

TEST_CASE("Server options defaults", "[options]") {
    auto options = parse({"pong.ch8"});

    CHECK(options.program_filepath == "pong.ch8");
    CHECK(options.address == "0.0.0.0");
    CHECK(options.port == 51400);
    CHECK(options.instructions_per_second == 600);
    CHECK_FALSE(options.seed.has_value());
    CHECK_FALSE(options.start_paused);
    CHECK_FALSE(options.trace);
    CHECK_FALSE(options.show_help);
    CHECK_FALSE(options.show_info);
}

TEST_CASE("Server options flags", "[options]") {
    SECTION("All options together") {
        auto options = parse({"--port", "50100", "--address", "127.0.0.1", "--ips", "1200",
                              "--seed", "42", "--paused", "--trace", "game.ch8"});
        CHECK(options.program_filepath == "game.ch8");
        CHECK(options.port == 50100);
        CHECK(options.address == "127.0.0.1");
        CHECK(options.instructions_per_second == 1200);
        REQUIRE(options.seed.has_value());
        CHECK(*options.seed == 42);
        CHECK(options.start_paused);
        CHECK(options.trace);
    }

    SECTION("Numbers accept a hex prefix") {
        auto options = parse({"game.ch8", "--port", "0xC8C9"});
        CHECK(options.port == 0xC8C9);
    }

    SECTION("Help and info need no program") {
        CHECK(parse({"--help"}).show_help);
        CHECK(parse({"-h"}).show_help);
        CHECK(parse({"--info"}).show_info);
    }
}

TEST_CASE("Server options errors", "[options]") {
    SECTION("Program is required") {
        REQUIRE_THROWS_AS(parse({}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"--trace"}), std::invalid_argument);
    }

    SECTION("Unknown flags are rejected") {
        REQUIRE_THROWS_AS(parse({"game.ch8", "--turbo"}), std::invalid_argument);
    }

    SECTION("A second program is rejected") {
        REQUIRE_THROWS_AS(parse({"one.ch8", "two.ch8"}), std::invalid_argument);
    }

    SECTION("Flag missing its value is rejected") {
        REQUIRE_THROWS_AS(parse({"game.ch8", "--port"}), std::invalid_argument);
    }

    SECTION("Bad numbers are rejected") {
        REQUIRE_THROWS_AS(parse({"game.ch8", "--port", "65536"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"game.ch8", "--port", "12ab"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"game.ch8", "--seed", "-1"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"game.ch8", "--seed", "lots"}), std::invalid_argument);
    }

    SECTION("Instruction rate outside the machine's range is rejected") {
        REQUIRE_THROWS_AS(parse({"game.ch8", "--ips", "59"}), std::invalid_argument);
        REQUIRE_THROWS_AS(parse({"game.ch8", "--ips", "100001"}), std::invalid_argument);
        CHECK(parse({"game.ch8", "--ips", "60"}).instructions_per_second == 60);
    }
}
