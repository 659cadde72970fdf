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

#ifndef CHIPIUM_TYPES_HPP
#define CHIPIUM_TYPES_HPP

#include <cstdint>
#include <cstddef>

namespace chipium {

constexpr size_t kMemorySize = 4096;         // 4KB address space

constexpr uint16_t kInterpreterStart = 0x000;
constexpr uint16_t kInterpreterEnd = 0x1FF;  // Reserved interpreter region

constexpr uint16_t kFontStart = 0x000;       // Glyph table for hex digits 0-F
constexpr size_t kGlyphSize = 5;             // 5 rows per glyph
constexpr size_t kGlyphCount = 16;
constexpr size_t kFontSize = kGlyphSize * kGlyphCount;

constexpr uint16_t kStackStart = 0x052;      // Return address window, just above the font
constexpr size_t kStackDepth = 16;           // Nested calls
constexpr uint16_t kStackEnd = kStackStart + kStackDepth * 2;  // exclusive

constexpr uint16_t kProgramStart = 0x200;    // Initial program counter
constexpr size_t kMaxProgramSize = kMemorySize - kProgramStart;

constexpr size_t kRegisterCount = 16;
constexpr uint8_t kFlagRegister = 0xF;       // VF: carry, borrow and collision output

constexpr size_t kKeyCount = 16;             // Hex keypad 0-F

constexpr size_t kDisplayWidth = 64;
constexpr size_t kDisplayHeight = 32;

constexpr uint32_t kTimerRateHz = 60;        // Delay and sound timer decrement rate

static_assert(kFontStart + kFontSize <= kStackStart, "font overlaps call stack");
static_assert(kStackEnd <= kProgramStart, "call stack overlaps program area");

} // namespace chipium

#endif // CHIPIUM_TYPES_HPP
