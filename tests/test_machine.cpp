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
#include <chipium/Errors.hpp>
#include <chipium/Machine.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace chipium;

namespace {

std::vector<uint8_t> assemble(std::initializer_list<uint16_t> words) {
    std::vector<uint8_t> bytes;
    for (uint16_t word : words) {
        bytes.push_back(static_cast<uint8_t>(word >> 8));
        bytes.push_back(static_cast<uint8_t>(word & 0xFF));
    }
    return bytes;
}

// V0 += 1 forever, never jumping to the same address
const std::initializer_list<uint16_t> kCountingLoop = {0x7001, 0x1200};

} // anonymous namespace

TEST_CASE("Machine instruction rate", "[machine][init]") {
    SECTION("Default rate gives ten instructions per frame") {
        Machine machine(assemble(kCountingLoop));
        REQUIRE(machine.instructions_per_frame() == 10);
    }

    SECTION("Rate below one instruction per frame is rejected") {
        MachineConfig config;
        config.instructions_per_second = Machine::MIN_INSTRUCTIONS_PER_SECOND - 1;
        REQUIRE_THROWS_AS(Machine(assemble(kCountingLoop), config), std::invalid_argument);
    }

    SECTION("Rate above the maximum is rejected") {
        MachineConfig config;
        config.instructions_per_second = Machine::MAX_INSTRUCTIONS_PER_SECOND + 1;
        REQUIRE_THROWS_AS(Machine(assemble(kCountingLoop), config), std::invalid_argument);
    }

    SECTION("Oversized program is rejected") {
        std::vector<uint8_t> program(kMaxProgramSize + 1, 0x00);
        REQUIRE_THROWS_AS(Machine(program), OutOfBounds);
    }
}

TEST_CASE("Machine frames", "[machine][execution]") {
    Machine machine(assemble(kCountingLoop));

    SECTION("A frame runs the instruction budget") {
        REQUIRE(machine.run_frame() == 10);
        auto snap = machine.snapshot();
        CHECK(snap.instruction_count == 10);
        CHECK(snap.registers[0] == 5);
    }

    SECTION("Nothing runs while paused") {
        machine.pause("test");
        REQUIRE(machine.run_frame() == 0);
        CHECK(machine.snapshot().instruction_count == 0);
        CHECK(machine.halt_reason() == "test");
    }

    SECTION("Resume clears the halt reason") {
        machine.pause("test");
        REQUIRE(machine.resume());
        CHECK_FALSE(machine.is_paused());
        CHECK(machine.halt_reason().empty());
        CHECK(machine.run_frame() == 10);
    }

    SECTION("Sequence advances as the machine runs") {
        auto before = machine.sequence();
        machine.run_frame();
        CHECK(machine.sequence() > before);
    }

    SECTION("Memory snapshot covers the whole store") {
        auto memory = machine.memory_snapshot();
        REQUIRE(memory.size() == kMemorySize);
        CHECK(memory[0x200] == 0x70);
        CHECK(memory[0x201] == 0x01);
    }
}

TEST_CASE("Machine timers tick once per frame", "[machine][timers]") {
    // Set delay and sound to 5, then loop
    Machine machine(assemble({0x6105, 0xF115, 0xF118, 0x7001, 0x1206}));

    machine.run_frame();
    CHECK(machine.snapshot().delay_timer == 4);
    CHECK(machine.snapshot().sound_timer == 4);

    machine.run_frame();
    CHECK(machine.snapshot().delay_timer == 3);

    machine.tick_timers();
    CHECK(machine.snapshot().delay_timer == 2);
}

TEST_CASE("Machine pauses on an infinite jump", "[machine][halt]") {
    Machine machine(assemble({0x6001, 0x1202}));

    REQUIRE(machine.run_frame() == 2);
    CHECK(machine.is_paused());
    CHECK_FALSE(machine.is_faulted());
    CHECK(machine.halt_reason() == "infinite jump at 0x202");
    CHECK(machine.snapshot().pc == 0x202);

    SECTION("The machine can be resumed") {
        REQUIRE(machine.resume());
        CHECK_FALSE(machine.is_paused());
    }
}

TEST_CASE("Machine faults on processor errors", "[machine][fault]") {
    SECTION("Unimplemented instruction") {
        Machine machine(assemble({0x6001, 0x0FFF}));

        REQUIRE_THROWS_AS(machine.run_frame(), UnimplementedInstruction);
        CHECK(machine.is_faulted());
        CHECK(machine.is_paused());
        CHECK(machine.halt_reason() == "Unimplemented instruction 0x0FFF at address 0x202");
        CHECK(machine.snapshot().pc == 0x202);
        CHECK(machine.snapshot().instruction_count == 1);
    }

    SECTION("Stack underflow") {
        Machine machine(assemble({0x00EE}));

        REQUIRE_THROWS_AS(machine.run_frame(), OutOfBounds);
        CHECK(machine.is_faulted());
        CHECK(machine.is_paused());
    }

    SECTION("A faulted machine cannot resume or step") {
        Machine machine(assemble({0x0FFF}));
        REQUIRE_THROWS(machine.run_frame());

        CHECK_FALSE(machine.resume());
        CHECK(machine.is_paused());
        CHECK_THROWS_AS(machine.step_instruction(), std::logic_error);
    }

    SECTION("Reset clears the fault but keeps the machine paused") {
        Machine machine(assemble({0x0FFF}));
        REQUIRE_THROWS(machine.run_frame());

        machine.reset();
        CHECK_FALSE(machine.is_faulted());
        CHECK(machine.is_paused());
        CHECK(machine.halt_reason().empty());
        CHECK(machine.resume());
    }
}

TEST_CASE("Machine single stepping", "[machine][step]") {
    Machine machine(assemble(kCountingLoop));
    machine.pause("stepping");

    machine.step_instruction();
    machine.step_instruction();
    machine.step_instruction();

    auto snap = machine.snapshot();
    CHECK(snap.instruction_count == 3);
    CHECK(snap.pc == 0x202);
    CHECK(snap.registers[0] == 2);
    CHECK(machine.is_paused());
}

TEST_CASE("Machine keypad feeds the processor", "[machine][keys]") {
    Machine machine(assemble({0xF30A, 0x7001, 0x1202}));
    machine.pause("stepping");

    machine.step_instruction();
    auto snap = machine.snapshot();
    REQUIRE(snap.awaiting_key);
    CHECK(snap.key_target == 3);

    machine.keypad().key_down(0xB);
    machine.step_instruction();
    snap = machine.snapshot();
    CHECK_FALSE(snap.awaiting_key);
    CHECK(snap.registers[3] == 0xB);
}

TEST_CASE("Machine display tracking", "[machine][display]") {
    // Draw glyph 0 at (0, 0), then loop
    Machine machine(assemble({0xA000, 0xD015, 0x7001, 0x1204}));
    auto initial_version = machine.display_version();

    machine.run_frame();
    CHECK(machine.display_version() > initial_version);

    auto frame = machine.frame_snapshot();
    REQUIRE(frame.pixels.size() == kDisplayWidth * kDisplayHeight);
    CHECK(std::count(frame.pixels.begin(), frame.pixels.end(), uint8_t{1}) == 14);
    CHECK(frame.version == machine.display_version());

    SECTION("Reset clears the display and bumps the version") {
        auto version = machine.display_version();
        machine.reset();
        CHECK(machine.display_version() > version);
        auto cleared = machine.frame_snapshot();
        CHECK(std::count(cleared.pixels.begin(), cleared.pixels.end(), uint8_t{1}) == 0);
        CHECK(cleared.version == machine.display_version());
        CHECK(machine.snapshot().pc == 0x200);
    }
}

TEST_CASE("Machine frame snapshot pairs pixels with their version", "[machine][display]") {
    // Each DRW toggles glyph 0, so odd versions show it and even versions don't:
    //   0x200  LD I, 0x000
    //   0x202  DRW V0, V0, 5
    //   0x204  JP 0x202
    Machine machine(assemble({0xA000, 0xD005, 0x1202}));

    std::atomic<bool> running{true};
    std::thread emu_thread([&]() {
        while (running) {
            machine.run_frame();
        }
    });

    bool consistent = true;
    for (int i = 0; i < 2000 && consistent; ++i) {
        auto frame = machine.frame_snapshot();
        auto lit = std::count(frame.pixels.begin(), frame.pixels.end(), uint8_t{1});
        consistent = (lit == (frame.version % 2 == 1 ? 14 : 0));
    }

    running = false;
    emu_thread.join();

    CHECK(consistent);
}

TEST_CASE("Machine fault wins over a concurrent resume", "[machine][fault]") {
    for (int attempt = 0; attempt < 50; ++attempt) {
        Machine machine(assemble({0x6001, 0x0FFF}));

        std::atomic<bool> running{true};
        std::thread resume_thread([&]() {
            while (running) {
                machine.resume();
            }
        });

        CHECK_THROWS_AS(machine.run_frame(), UnimplementedInstruction);

        running = false;
        resume_thread.join();

        REQUIRE(machine.is_faulted());
        REQUIRE(machine.is_paused());
        REQUIRE_FALSE(machine.resume());
    }
}

TEST_CASE("Machine pause waiting", "[machine][pause]") {
    Machine machine(assemble(kCountingLoop));

    CHECK(machine.wait_if_paused(std::chrono::milliseconds(1)));

    machine.pause("waiting");
    CHECK_FALSE(machine.wait_if_paused(std::chrono::milliseconds(1)));
}

TEST_CASE("Machine trace output", "[machine][trace]") {
    std::ostringstream trace;
    MachineConfig config;
    config.trace = &trace;

    Machine machine(assemble({0x6A2F, 0x00E0, 0x1200}), config);

    SECTION("Construction dumps memory") {
        const auto text = trace.str();
        CHECK(text.rfind("Memory:\n", 0) == 0);
        CHECK(text.find("200: 6A 2F 00 E0 12 00") != std::string::npos);
    }

    SECTION("Each instruction is logged before it runs") {
        trace.str("");
        machine.pause("tracing");
        machine.step_instruction();
        machine.step_instruction();

        const auto text = trace.str();
        CHECK(text.find("[0x200] 6A2F  LD VA, 0x2F\n") != std::string::npos);
        CHECK(text.find("[0x202] 00E0  CLS\n") != std::string::npos);
    }
}
