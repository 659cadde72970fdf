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

#include "chipium/Instruction.hpp"

#include <iomanip>
#include <sstream>

namespace chipium {

namespace {

std::optional<Instruction> make(Operation operation, uint16_t opcode) {
    return Instruction{operation, opcode};
}

// 8XYn arithmetic/logic group, selected by the low nibble
std::optional<Instruction> decode_alu(uint16_t opcode) {
    switch (opcode & 0x000F) {
        case 0x0: return make(Operation::Move, opcode);
        case 0x1: return make(Operation::Or, opcode);
        case 0x2: return make(Operation::And, opcode);
        case 0x3: return make(Operation::Xor, opcode);
        case 0x4: return make(Operation::AddRegister, opcode);
        case 0x5: return make(Operation::Subtract, opcode);
        case 0x6: return make(Operation::ShiftRight, opcode);
        case 0x7: return make(Operation::SubtractReversed, opcode);
        case 0xE: return make(Operation::ShiftLeft, opcode);
        default:  return std::nullopt;
    }
}

// FXnn group, selected by the low byte
std::optional<Instruction> decode_misc(uint16_t opcode) {
    switch (opcode & 0x00FF) {
        case 0x07: return make(Operation::LoadDelayTimer, opcode);
        case 0x0A: return make(Operation::WaitForKey, opcode);
        case 0x15: return make(Operation::SetDelayTimer, opcode);
        case 0x18: return make(Operation::SetSoundTimer, opcode);
        case 0x1E: return make(Operation::AddIndex, opcode);
        case 0x29: return make(Operation::LoadGlyph, opcode);
        case 0x33: return make(Operation::StoreDecimal, opcode);
        case 0x55: return make(Operation::StoreRegisters, opcode);
        case 0x65: return make(Operation::LoadRegisters, opcode);
        default:   return std::nullopt;
    }
}

std::string hex(unsigned value, int width) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::uppercase << std::setw(width) << std::setfill('0') << value;
    return oss.str();
}

std::string reg(uint8_t index) {
    std::ostringstream oss;
    oss << 'V' << std::hex << std::uppercase << static_cast<int>(index);
    return oss.str();
}

} // anonymous namespace

std::optional<Instruction> decode(uint16_t opcode) {
    switch (opcode & 0xF000) {
        case 0x0000:
            if (opcode == 0x00E0) return make(Operation::ClearScreen, opcode);
            if (opcode == 0x00EE) return make(Operation::Return, opcode);
            return std::nullopt;
        case 0x1000: return make(Operation::Jump, opcode);
        case 0x2000: return make(Operation::Call, opcode);
        case 0x3000: return make(Operation::SkipIfEqualImmediate, opcode);
        case 0x4000: return make(Operation::SkipIfNotEqualImmediate, opcode);
        case 0x5000:
            if ((opcode & 0x000F) == 0) return make(Operation::SkipIfEqualRegister, opcode);
            return std::nullopt;
        case 0x6000: return make(Operation::LoadImmediate, opcode);
        case 0x7000: return make(Operation::AddImmediate, opcode);
        case 0x8000: return decode_alu(opcode);
        case 0x9000:
            if ((opcode & 0x000F) == 0) return make(Operation::SkipIfNotEqualRegister, opcode);
            return std::nullopt;
        case 0xA000: return make(Operation::LoadIndex, opcode);
        case 0xB000: return make(Operation::JumpOffset, opcode);
        case 0xC000: return make(Operation::Random, opcode);
        case 0xD000: return make(Operation::Draw, opcode);
        case 0xE000:
            if ((opcode & 0x00FF) == 0x9E) return make(Operation::SkipIfKeyPressed, opcode);
            if ((opcode & 0x00FF) == 0xA1) return make(Operation::SkipIfKeyNotPressed, opcode);
            return std::nullopt;
        case 0xF000: return decode_misc(opcode);
    }
    return std::nullopt;
}

std::string to_string(const Instruction& in) {
    const std::string vx = reg(in.x());
    const std::string vy = reg(in.y());

    switch (in.operation) {
        case Operation::ClearScreen:             return "CLS";
        case Operation::Return:                  return "RET";
        case Operation::Jump:                    return "JP " + hex(in.nnn(), 3);
        case Operation::Call:                    return "CALL " + hex(in.nnn(), 3);
        case Operation::SkipIfEqualImmediate:    return "SE " + vx + ", " + hex(in.nn(), 2);
        case Operation::SkipIfNotEqualImmediate: return "SNE " + vx + ", " + hex(in.nn(), 2);
        case Operation::SkipIfEqualRegister:     return "SE " + vx + ", " + vy;
        case Operation::LoadImmediate:           return "LD " + vx + ", " + hex(in.nn(), 2);
        case Operation::AddImmediate:            return "ADD " + vx + ", " + hex(in.nn(), 2);
        case Operation::Move:                    return "LD " + vx + ", " + vy;
        case Operation::Or:                      return "OR " + vx + ", " + vy;
        case Operation::And:                     return "AND " + vx + ", " + vy;
        case Operation::Xor:                     return "XOR " + vx + ", " + vy;
        case Operation::AddRegister:             return "ADD " + vx + ", " + vy;
        case Operation::Subtract:                return "SUB " + vx + ", " + vy;
        case Operation::ShiftRight:              return "SHR " + vx;
        case Operation::SubtractReversed:        return "SUBN " + vx + ", " + vy;
        case Operation::ShiftLeft:               return "SHL " + vx;
        case Operation::SkipIfNotEqualRegister:  return "SNE " + vx + ", " + vy;
        case Operation::LoadIndex:               return "LD I, " + hex(in.nnn(), 3);
        case Operation::JumpOffset:              return "JP V0, " + hex(in.nnn(), 3);
        case Operation::Random:                  return "RND " + vx + ", " + hex(in.nn(), 2);
        case Operation::Draw:
            return "DRW " + vx + ", " + vy + ", " + std::to_string(in.n());
        case Operation::SkipIfKeyPressed:        return "SKP " + vx;
        case Operation::SkipIfKeyNotPressed:     return "SKNP " + vx;
        case Operation::LoadDelayTimer:          return "LD " + vx + ", DT";
        case Operation::WaitForKey:              return "LD " + vx + ", K";
        case Operation::SetDelayTimer:           return "LD DT, " + vx;
        case Operation::SetSoundTimer:           return "LD ST, " + vx;
        case Operation::AddIndex:                return "ADD I, " + vx;
        case Operation::LoadGlyph:               return "LD F, " + vx;
        case Operation::StoreDecimal:            return "LD B, " + vx;
        case Operation::StoreRegisters:          return "LD [I], " + vx;
        case Operation::LoadRegisters:           return "LD " + vx + ", [I]";
    }
    return "???";
}

} // namespace chipium
