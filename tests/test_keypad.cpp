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
#include <chipium/Keypad.hpp>

using namespace chipium;

TEST_CASE("Keypad starts with no keys pressed", "[keypad]") {
    Keypad keypad;

    REQUIRE(keypad.state() == 0);
    for (uint8_t key = 0; key < Keypad::NUM_KEYS; ++key) {
        REQUIRE_FALSE(keypad.is_key_pressed(key));
    }
}

TEST_CASE("Keypad key down and up", "[keypad]") {
    Keypad keypad;

    SECTION("Key down sets the matching bit") {
        keypad.key_down(0xA);
        REQUIRE(keypad.is_key_pressed(0xA));
        REQUIRE(keypad.state() == (1u << 0xA));
    }

    SECTION("Key up clears only that key") {
        keypad.key_down(0x1);
        keypad.key_down(0xF);
        keypad.key_up(0x1);
        REQUIRE_FALSE(keypad.is_key_pressed(0x1));
        REQUIRE(keypad.is_key_pressed(0xF));
    }

    SECTION("Clear releases everything") {
        keypad.key_down(0x0);
        keypad.key_down(0x7);
        keypad.clear();
        REQUIRE(keypad.state() == 0);
    }

    SECTION("Keys outside the pad are ignored") {
        keypad.key_down(16);
        keypad.key_down(0xFF);
        REQUIRE(keypad.state() == 0);
        REQUIRE_FALSE(keypad.is_key_pressed(16));
    }
}
