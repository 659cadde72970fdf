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

#ifndef CHIPIUM_MACHINE_HPP
#define CHIPIUM_MACHINE_HPP

#include "HostInterfaces.hpp"
#include "Keypad.hpp"
#include "Processor.hpp"
#include "Types.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chipium {

struct MachineConfig {
    uint32_t instructions_per_second = 600;
    uint32_t seed = std::mt19937::default_seed;
    std::ostream* trace = nullptr;   // Instruction trace sink (nullptr = off)
};

// Point-in-time copy of processor state for hosts and the control service
struct MachineSnapshot {
    std::array<uint8_t, kRegisterCount> registers{};
    uint16_t pc = 0;
    uint16_t index = 0;
    uint16_t sp = 0;
    uint8_t delay_timer = 0;
    uint8_t sound_timer = 0;
    bool awaiting_key = false;
    uint8_t key_target = 0;
    uint64_t instruction_count = 0;
};

// Display contents paired with the version they were taken at
struct FrameSnapshot {
    uint64_t version = 0;
    std::vector<uint8_t> pixels;   // Row-major, one byte per pixel
};

// Host-side driver for a Processor.
//
// Plays the part of the host application: supplies key state from its Keypad,
// receives display, halt and error events, and drives the instruction clock and
// the 60Hz timer clock from a single thread of control.
//
// Every public operation takes the same lock, so the emulation loop and
// gRPC handler threads never touch processor state at the same time.
//
// Pause state uses a separate lock and condition variable so that events raised
// from inside step() can pause the machine without re-entering the main lock.
class Machine final : public HostNotifier {
public:
    static constexpr uint32_t FRAME_RATE_HZ = kTimerRateHz;
    static constexpr uint32_t MIN_INSTRUCTIONS_PER_SECOND = FRAME_RATE_HZ;
    static constexpr uint32_t MAX_INSTRUCTIONS_PER_SECOND = 100000;

    // Throws OutOfBounds if the program is too large, std::invalid_argument
    // if the instruction rate is out of range.
    explicit Machine(std::vector<uint8_t> program, MachineConfig config = {});
    ~Machine() override;

    // Non-copyable
    Machine(const Machine&) = delete;
    Machine& operator=(const Machine&) = delete;

    // Rebuild the processor from the program image and clear any fault.
    // Pause state is left as it is.
    void reset();

    // Execute one frame: up to instructions_per_frame() steps, stopping early
    // if the machine pauses, then one timer tick. Does nothing while paused.
    // Returns the number of steps taken. Rethrows processor errors after
    // pausing and faulting the machine.
    uint32_t run_frame();

    // Execute a single step regardless of pause state (for single-stepping).
    // Throws std::logic_error if the machine is faulted.
    void step_instruction();

    // Tick the delay and sound timers once
    void tick_timers();

    uint32_t instructions_per_frame() const { return instructions_per_frame_; }

    // --- Input ---

    Keypad& keypad() { return keypad_; }
    const Keypad& keypad() const { return keypad_; }

    // --- Execution control ---

    bool is_paused() const { return paused_.load(); }
    bool is_faulted() const { return faulted_.load(); }

    void pause(const std::string& reason);

    // Returns false (and stays paused) if the machine is faulted
    bool resume();

    // Block while paused, for at most timeout. Returns true if running.
    bool wait_if_paused(std::chrono::milliseconds timeout);

    std::string halt_reason() const;

    // Increments on any state change, for change detection
    uint64_t sequence() const { return sequence_.load(); }

    // --- Observation ---

    // Increments whenever the display changes (including reset)
    uint64_t display_version() const { return display_version_.load(); }

    // Framebuffer copy and display version, taken together under the lock
    FrameSnapshot frame_snapshot() const;

    MachineSnapshot snapshot() const;

    // Copy of the full 4KB memory
    std::vector<uint8_t> memory_snapshot() const;

    // --- HostNotifier ---

    void display_changed() override;
    void halt_recommended(uint16_t address) override;
    void emulation_error(const UnimplementedInstruction& error) override;

private:
    std::unique_ptr<Processor> make_processor();
    void step_locked();
    void fault(const std::string& reason);

    const std::vector<uint8_t> program_;
    const MachineConfig config_;
    const uint32_t instructions_per_frame_;

    Keypad keypad_;

    mutable std::mutex mutex_;          // Guards processor_
    std::unique_ptr<Processor> processor_;

    mutable std::mutex pause_mutex_;    // Guards halt_reason_ and paused_/faulted_ transitions
    std::condition_variable pause_cv_;
    std::atomic<bool> paused_{false};
    std::atomic<bool> faulted_{false};
    std::string halt_reason_;

    std::atomic<uint64_t> sequence_{0};
    std::atomic<uint64_t> display_version_{0};
};

} // namespace chipium

#endif // CHIPIUM_MACHINE_HPP
