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

#ifndef CHIPIUM_PROCESSOR_HPP
#define CHIPIUM_PROCESSOR_HPP

#include "Font.hpp"
#include "FrameBuffer.hpp"
#include "HostInterfaces.hpp"
#include "Instruction.hpp"
#include "Memory.hpp"
#include "Types.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <random>
#include <span>

namespace chipium {

enum class ProcessorState : uint8_t {
    Running,
    AwaitingKey   // FX0A executed; step() polls the keypad instead of fetching
};

// Trace callback: fetch address and decoded instruction, called before execution
using TraceCallback = std::function<void(uint16_t address, const Instruction& instruction)>;

// CHIP-8 fetch/decode/execute core.
//
// Owns the register file, program counter, index register, call stack pointer,
// timers, Memory and FrameBuffer. Key state and host events go through the
// capability interfaces supplied at construction, which must outlive the
// processor.
//
// step() and tick_timers() must not run concurrently against the same instance.
class Processor {
public:
    // Throws OutOfBounds if the program does not fit above kProgramStart.
    Processor(InputCapability& input,
              HostNotifier& host,
              std::span<const uint8_t> program,
              uint32_t seed = std::mt19937::default_seed,
              std::span<const uint8_t> font = kFontData);

    // Non-copyable (the framebuffer callback captures this)
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;

    // Execute one instruction, or poll the keypad once while awaiting a key.
    // Throws UnimplementedInstruction (after notifying the host) or OutOfBounds;
    // in either case the failing instruction has no effect.
    void step();

    // Decrement the delay and sound timers towards zero.
    // Call at kTimerRateHz, independent of the step rate.
    void tick_timers();

    // --- State inspection ---

    ProcessorState state() const { return state_; }
    bool is_awaiting_key() const { return state_ == ProcessorState::AwaitingKey; }
    uint8_t key_target() const { return key_target_; }

    uint8_t v(uint8_t reg) const { return registers_[reg & 0x0F]; }
    const std::array<uint8_t, kRegisterCount>& registers() const { return registers_; }

    uint16_t pc() const { return pc_; }
    uint16_t index() const { return index_; }
    uint16_t sp() const { return sp_; }
    uint8_t delay_timer() const { return delay_timer_; }
    uint8_t sound_timer() const { return sound_timer_; }

    // Instructions executed (polling cycles while awaiting a key excluded)
    uint64_t instruction_count() const { return instruction_count_; }

    const Memory& memory() const { return memory_; }
    const FrameBuffer& frame_buffer() const { return frame_buffer_; }

    void set_trace_callback(TraceCallback cb) { on_trace_ = std::move(cb); }

private:
    void execute(const Instruction& instruction, uint16_t address);
    void poll_for_key();
    void jump(uint16_t target, uint16_t address);
    void skip_if(bool condition);
    void push(uint16_t value);
    uint16_t pop();
    uint8_t& vf() { return registers_[kFlagRegister]; }

    InputCapability& input_;
    HostNotifier& host_;

    Memory memory_;
    FrameBuffer frame_buffer_;

    std::array<uint8_t, kRegisterCount> registers_{};
    uint16_t pc_ = kProgramStart;
    uint16_t index_ = 0;
    uint16_t sp_ = kStackStart;
    uint8_t delay_timer_ = 0;
    uint8_t sound_timer_ = 0;

    ProcessorState state_ = ProcessorState::Running;
    uint8_t key_target_ = 0;

    std::mt19937 rng_;
    uint64_t instruction_count_ = 0;
    TraceCallback on_trace_;
};

} // namespace chipium

#endif // CHIPIUM_PROCESSOR_HPP
