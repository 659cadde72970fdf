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

#ifndef CHIPIUM_INSTRUCTION_HPP
#define CHIPIUM_INSTRUCTION_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace chipium {

// One entry per opcode family of the base instruction set.
// Operand nibbles: X = bits 8-11, Y = bits 4-7, N = bits 0-3,
// NN = bits 0-7, NNN = bits 0-11.
enum class Operation : uint8_t {
    ClearScreen,             // 00E0
    Return,                  // 00EE
    Jump,                    // 1NNN
    Call,                    // 2NNN
    SkipIfEqualImmediate,    // 3XNN
    SkipIfNotEqualImmediate, // 4XNN
    SkipIfEqualRegister,     // 5XY0
    LoadImmediate,           // 6XNN
    AddImmediate,            // 7XNN
    Move,                    // 8XY0
    Or,                      // 8XY1
    And,                     // 8XY2
    Xor,                     // 8XY3
    AddRegister,             // 8XY4
    Subtract,                // 8XY5
    ShiftRight,              // 8XY6
    SubtractReversed,        // 8XY7
    ShiftLeft,               // 8XYE
    SkipIfNotEqualRegister,  // 9XY0
    LoadIndex,               // ANNN
    JumpOffset,              // BNNN
    Random,                  // CXNN
    Draw,                    // DXYN
    SkipIfKeyPressed,        // EX9E
    SkipIfKeyNotPressed,     // EXA1
    LoadDelayTimer,          // FX07
    WaitForKey,              // FX0A
    SetDelayTimer,           // FX15
    SetSoundTimer,           // FX18
    AddIndex,                // FX1E
    LoadGlyph,               // FX29
    StoreDecimal,            // FX33
    StoreRegisters,          // FX55
    LoadRegisters,           // FX65
};

// A decoded instruction word: the operation tag plus the raw word
// from which operand fields are extracted.
struct Instruction {
    Operation operation;
    uint16_t opcode;

    uint8_t x() const { return static_cast<uint8_t>((opcode >> 8) & 0x0F); }
    uint8_t y() const { return static_cast<uint8_t>((opcode >> 4) & 0x0F); }
    uint8_t n() const { return static_cast<uint8_t>(opcode & 0x000F); }
    uint8_t nn() const { return static_cast<uint8_t>(opcode & 0x00FF); }
    uint16_t nnn() const { return static_cast<uint16_t>(opcode & 0x0FFF); }
};

// Decode a 16-bit instruction word. Returns std::nullopt if the word
// matches no entry in the instruction set.
std::optional<Instruction> decode(uint16_t opcode);

// Conventional mnemonic rendering, e.g. "ADD V3, V4" (for trace output)
std::string to_string(const Instruction& instruction);

} // namespace chipium

#endif // CHIPIUM_INSTRUCTION_HPP
