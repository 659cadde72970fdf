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

#include "chipium/Processor.hpp"
#include "chipium/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace chipium {

Processor::Processor(InputCapability& input,
                     HostNotifier& host,
                     std::span<const uint8_t> program,
                     uint32_t seed,
                     std::span<const uint8_t> font)
    : input_(input)
    , host_(host)
    , frame_buffer_([this] { host_.display_changed(); })
    , rng_(seed)
{
    memory_.load_font(font);
    memory_.load_program(program);
}

void Processor::tick_timers() {
    if (delay_timer_ > 0) {
        --delay_timer_;
    }
    if (sound_timer_ > 0) {
        --sound_timer_;
    }
}

void Processor::step() {
    if (state_ == ProcessorState::AwaitingKey) {
        poll_for_key();
        return;
    }

    const uint16_t address = pc_;
    const uint16_t opcode = memory_.read_word(address);

    const auto instruction = decode(opcode);
    if (!instruction) {
        UnimplementedInstruction error(opcode, address);
        host_.emulation_error(error);
        throw error;
    }

    if (on_trace_) {
        on_trace_(address, *instruction);
    }

    pc_ = static_cast<uint16_t>(address + 2);
    try {
        execute(*instruction, address);
    } catch (const OutOfBounds&) {
        // Every operation checks before it mutates, so only the PC needs rewinding
        pc_ = address;
        throw;
    }
    ++instruction_count_;
}

void Processor::poll_for_key() {
    for (uint8_t key = 0; key < kKeyCount; ++key) {
        if (input_.is_key_pressed(key)) {
            registers_[key_target_] = key;
            state_ = ProcessorState::Running;
            return;
        }
    }
}

void Processor::jump(uint16_t target, uint16_t address) {
    // Only a jump to itself is detected; longer cycles run on
    if (target == address) {
        host_.halt_recommended(address);
    }
    pc_ = target;
}

void Processor::skip_if(bool condition) {
    if (condition) {
        pc_ = static_cast<uint16_t>(pc_ + 2);
    }
}

void Processor::push(uint16_t value) {
    if (sp_ + 2 > kStackEnd) {
        std::ostringstream oss;
        oss << "Call stack overflow (depth " << kStackDepth << ")";
        throw OutOfBounds(oss.str(), sp_, 2);
    }
    const std::array<uint8_t, 2> bytes = {
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value & 0xFF)
    };
    memory_.write_range(sp_, bytes);
    sp_ = static_cast<uint16_t>(sp_ + 2);
}

uint16_t Processor::pop() {
    if (sp_ < kStackStart + 2) {
        throw OutOfBounds("Call stack underflow (return without call)", sp_, 2);
    }
    sp_ = static_cast<uint16_t>(sp_ - 2);
    return memory_.read_word(sp_);
}

void Processor::execute(const Instruction& in, uint16_t address) {
    uint8_t& vx = registers_[in.x()];
    const uint8_t vy = registers_[in.y()];

    switch (in.operation) {
        case Operation::ClearScreen:
            frame_buffer_.clear();
            break;

        case Operation::Return:
            pc_ = pop();
            break;

        case Operation::Jump:
            jump(in.nnn(), address);
            break;

        case Operation::Call:
            push(pc_);
            pc_ = in.nnn();
            break;

        case Operation::SkipIfEqualImmediate:
            skip_if(vx == in.nn());
            break;

        case Operation::SkipIfNotEqualImmediate:
            skip_if(vx != in.nn());
            break;

        case Operation::SkipIfEqualRegister:
            skip_if(vx == vy);
            break;

        case Operation::LoadImmediate:
            vx = in.nn();
            break;

        case Operation::AddImmediate:
            // Wraps; VF untouched
            vx = static_cast<uint8_t>(vx + in.nn());
            break;

        case Operation::Move:
            vx = vy;
            break;

        case Operation::Or:
            vx = static_cast<uint8_t>(vx | vy);
            break;

        case Operation::And:
            vx = static_cast<uint8_t>(vx & vy);
            break;

        case Operation::Xor:
            vx = static_cast<uint8_t>(vx ^ vy);
            break;

        case Operation::AddRegister: {
            const int sum = vx + vy;
            vx = static_cast<uint8_t>(sum & 0xFF);
            vf() = sum > 0xFF ? 1 : 0;
            break;
        }

        case Operation::Subtract: {
            const int diff = vx - vy;
            vx = static_cast<uint8_t>(diff & 0xFF);
            vf() = diff < 0 ? 0 : 1;
            break;
        }

        case Operation::ShiftRight:
            // VF is written first; with X == F the shift sees the flag
            vf() = vx & 0x01;
            vx = static_cast<uint8_t>(vx >> 1);
            break;

        case Operation::SubtractReversed: {
            const int diff = vy - vx;
            vx = static_cast<uint8_t>(diff & 0xFF);
            vf() = diff < 0 ? 0 : 1;
            break;
        }

        case Operation::ShiftLeft:
            vf() = static_cast<uint8_t>((vx & 0x80) >> 7);
            vx = static_cast<uint8_t>(vx << 1);
            break;

        case Operation::SkipIfNotEqualRegister:
            skip_if(vx != vy);
            break;

        case Operation::LoadIndex:
            index_ = in.nnn();
            break;

        case Operation::JumpOffset:
            jump(static_cast<uint16_t>(in.nnn() + registers_[0]), address);
            break;

        case Operation::Random:
            vx = static_cast<uint8_t>(rng_() & in.nn());
            break;

        case Operation::Draw: {
            const auto rows = memory_.read_range(index_, in.n());
            const bool collision = frame_buffer_.draw_sprite(vx, vy, rows);
            vf() = collision ? 1 : 0;
            break;
        }

        case Operation::SkipIfKeyPressed:
            skip_if(input_.is_key_pressed(vx));
            break;

        case Operation::SkipIfKeyNotPressed:
            skip_if(!input_.is_key_pressed(vx));
            break;

        case Operation::LoadDelayTimer:
            vx = delay_timer_;
            break;

        case Operation::WaitForKey:
            key_target_ = in.x();
            state_ = ProcessorState::AwaitingKey;
            break;

        case Operation::SetDelayTimer:
            delay_timer_ = vx;
            break;

        case Operation::SetSoundTimer:
            sound_timer_ = vx;
            break;

        case Operation::AddIndex: {
            uint32_t sum = index_ + vx;
            bool overflow = sum > 0xFFF;
            if (overflow) {
                sum -= 0x1000;
            }
            index_ = static_cast<uint16_t>(sum);
            vf() = overflow ? 1 : 0;
            break;
        }

        case Operation::LoadGlyph:
            index_ = static_cast<uint16_t>(kFontStart + vx * kGlyphSize);
            break;

        case Operation::StoreDecimal: {
            const std::array<uint8_t, 3> digits = {
                static_cast<uint8_t>(vx / 100),
                static_cast<uint8_t>((vx / 10) % 10),
                static_cast<uint8_t>(vx % 10)
            };
            memory_.write_range(index_, digits);
            break;
        }

        case Operation::StoreRegisters:
            memory_.write_range(index_, std::span<const uint8_t>(registers_.data(), in.x() + 1u));
            break;

        case Operation::LoadRegisters: {
            const auto bytes = memory_.read_range(index_, in.x() + 1u);
            std::copy(bytes.begin(), bytes.end(), registers_.begin());
            break;
        }
    }
}

} // namespace chipium
