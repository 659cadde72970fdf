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

#ifndef CHIPIUM_MEMORY_HPP
#define CHIPIUM_MEMORY_HPP

#include "Types.hpp"
#include <array>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <vector>

namespace chipium {

// Flat 4KB byte store.
//
// Layout:
//   0x000-0x04F  font glyphs
//   0x052-0x071  call stack window (managed by Processor)
//   0x200-0xFFF  program and data
//
// Every access is bounds checked and throws OutOfBounds rather than wrapping.
// Ranged writes are all-or-nothing.
class Memory {
public:
    Memory();

    // Zero the whole store
    void reset();

    // Load the glyph table at kFontStart
    void load_font(std::span<const uint8_t> font);

    // Load program bytes at kProgramStart
    void load_program(std::span<const uint8_t> program);

    // Single byte access
    uint8_t read(uint16_t addr) const;
    void write(uint16_t addr, uint8_t value);

    // Contiguous ranges [addr, addr + length)
    std::vector<uint8_t> read_range(uint16_t addr, size_t length) const;
    void write_range(uint16_t addr, std::span<const uint8_t> bytes);

    // Big-endian 16-bit word at [addr, addr + 2)
    uint16_t read_word(uint16_t addr) const;

    static constexpr size_t size() { return kMemorySize; }

    // Direct access (for inspection/debugging)
    const uint8_t* data() const { return bytes_.data(); }

private:
    void check_range(uint32_t addr, size_t length) const;

    std::array<uint8_t, kMemorySize> bytes_{};
};

// Hex dump, 16 bytes per line
std::ostream& operator<<(std::ostream& os, const Memory& memory);

} // namespace chipium

#endif // CHIPIUM_MEMORY_HPP
