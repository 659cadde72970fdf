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

#include "chipium/Machine.hpp"
#include "chipium/Errors.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chipium {

namespace {

uint32_t frame_budget(uint32_t instructions_per_second) {
    if (instructions_per_second < Machine::MIN_INSTRUCTIONS_PER_SECOND ||
        instructions_per_second > Machine::MAX_INSTRUCTIONS_PER_SECOND) {
        std::ostringstream oss;
        oss << "Instruction rate " << instructions_per_second << " out of range ("
            << Machine::MIN_INSTRUCTIONS_PER_SECOND << "-"
            << Machine::MAX_INSTRUCTIONS_PER_SECOND << ")";
        throw std::invalid_argument(oss.str());
    }
    return instructions_per_second / Machine::FRAME_RATE_HZ;
}

std::string hex_address(uint16_t address) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(3) << std::setfill('0') << address;
    return oss.str();
}

} // anonymous namespace

Machine::Machine(std::vector<uint8_t> program, MachineConfig config)
    : program_(std::move(program))
    , config_(config)
    , instructions_per_frame_(frame_budget(config.instructions_per_second))
{
    processor_ = make_processor();

    if (config_.trace) {
        *config_.trace << "Memory:\n" << processor_->memory();
    }
}

Machine::~Machine() = default;

std::unique_ptr<Processor> Machine::make_processor() {
    auto processor = std::make_unique<Processor>(keypad_, *this, program_, config_.seed);

    if (config_.trace) {
        std::ostream* out = config_.trace;
        processor->set_trace_callback(
            [out](uint16_t address, const Instruction& instruction) {
                const auto flags = out->flags();
                const auto fill = out->fill();
                *out << '[' << hex_address(address) << "] "
                     << std::hex << std::uppercase << std::setw(4) << std::setfill('0')
                     << instruction.opcode << "  " << to_string(instruction) << '\n';
                out->flags(flags);
                out->fill(fill);
            }
        );
    }
    return processor;
}

void Machine::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    processor_ = make_processor();
    {
        std::lock_guard<std::mutex> pause_lock(pause_mutex_);
        faulted_.store(false);
        halt_reason_.clear();
    }
    ++display_version_;
    ++sequence_;
}

void Machine::step_locked() {
    try {
        processor_->step();
    } catch (const OutOfBounds& e) {
        // UnimplementedInstruction faults via emulation_error() before it is thrown
        std::cerr << "Emulation error: " << e.what() << "\n";
        fault(e.what());
        throw;
    }
    ++sequence_;
}

uint32_t Machine::run_frame() {
    if (paused_.load()) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    uint32_t executed = 0;
    while (executed < instructions_per_frame_ && !paused_.load()) {
        step_locked();
        ++executed;
    }

    processor_->tick_timers();
    ++sequence_;
    return executed;
}

void Machine::step_instruction() {
    if (faulted_.load()) {
        throw std::logic_error("Machine is faulted; reset required");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    step_locked();
}

void Machine::tick_timers() {
    std::lock_guard<std::mutex> lock(mutex_);
    processor_->tick_timers();
    ++sequence_;
}

void Machine::pause(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        paused_.store(true);
        halt_reason_ = reason;
    }
    ++sequence_;
}

bool Machine::resume() {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        if (faulted_.load()) {
            return false;
        }
        paused_.store(false);
        halt_reason_.clear();
    }
    pause_cv_.notify_all();
    ++sequence_;
    return true;
}

bool Machine::wait_if_paused(std::chrono::milliseconds timeout) {
    if (!paused_.load()) {
        return true;
    }
    std::unique_lock<std::mutex> lock(pause_mutex_);
    return pause_cv_.wait_for(lock, timeout, [this] { return !paused_.load(); });
}

std::string Machine::halt_reason() const {
    std::lock_guard<std::mutex> lock(pause_mutex_);
    return halt_reason_;
}

void Machine::fault(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(pause_mutex_);
        faulted_.store(true);
        paused_.store(true);
        halt_reason_ = reason;
    }
    ++sequence_;
}

FrameSnapshot Machine::frame_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    FrameSnapshot frame;
    frame.version = display_version_.load();
    frame.pixels = processor_->frame_buffer().snapshot();
    return frame;
}

MachineSnapshot Machine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);

    MachineSnapshot snap;
    snap.registers = processor_->registers();
    snap.pc = processor_->pc();
    snap.index = processor_->index();
    snap.sp = processor_->sp();
    snap.delay_timer = processor_->delay_timer();
    snap.sound_timer = processor_->sound_timer();
    snap.awaiting_key = processor_->is_awaiting_key();
    snap.key_target = processor_->key_target();
    snap.instruction_count = processor_->instruction_count();
    return snap;
}

std::vector<uint8_t> Machine::memory_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint8_t* bytes = processor_->memory().data();
    return std::vector<uint8_t>(bytes, bytes + Memory::size());
}

void Machine::display_changed() {
    ++display_version_;
}

void Machine::halt_recommended(uint16_t address) {
    std::cerr << "Infinite jump detected at " << hex_address(address) << ", pausing\n";
    pause("infinite jump at " + hex_address(address));
}

void Machine::emulation_error(const UnimplementedInstruction& error) {
    std::cerr << "Emulation error: " << error.what() << "\n";
    fault(error.what());
}

} // namespace chipium
