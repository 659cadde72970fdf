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

#include "chipium/Memory.hpp"
#include "chipium/Errors.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace chipium {

Memory::Memory() {
    reset();
}

void Memory::reset() {
    std::fill(bytes_.begin(), bytes_.end(), 0);
}

void Memory::check_range(uint32_t addr, size_t length) const {
    if (addr > bytes_.size() || length > bytes_.size() - addr) {
        std::ostringstream oss;
        oss << "Memory access of " << length << " byte(s) at 0x"
            << std::hex << std::uppercase << std::setw(3) << std::setfill('0') << addr
            << " exceeds " << std::dec << bytes_.size() << " byte store";
        throw OutOfBounds(oss.str(), addr, length);
    }
}

void Memory::load_font(std::span<const uint8_t> font) {
    write_range(kFontStart, font);
}

void Memory::load_program(std::span<const uint8_t> program) {
    write_range(kProgramStart, program);
}

uint8_t Memory::read(uint16_t addr) const {
    check_range(addr, 1);
    return bytes_[addr];
}

void Memory::write(uint16_t addr, uint8_t value) {
    check_range(addr, 1);
    bytes_[addr] = value;
}

std::vector<uint8_t> Memory::read_range(uint16_t addr, size_t length) const {
    check_range(addr, length);
    return std::vector<uint8_t>(bytes_.begin() + addr, bytes_.begin() + addr + length);
}

void Memory::write_range(uint16_t addr, std::span<const uint8_t> bytes) {
    // Checked up front so a failing write leaves the store untouched
    check_range(addr, bytes.size());
    std::copy(bytes.begin(), bytes.end(), bytes_.begin() + addr);
}

uint16_t Memory::read_word(uint16_t addr) const {
    check_range(addr, 2);
    return static_cast<uint16_t>((bytes_[addr] << 8) | bytes_[addr + 1]);
}

std::ostream& operator<<(std::ostream& os, const Memory& memory) {
    const auto flags = os.flags();
    const auto fill = os.fill();
    os << std::hex << std::uppercase << std::setfill('0');

    const uint8_t* bytes = memory.data();
    for (size_t line = 0; line < Memory::size(); line += 16) {
        os << std::setw(3) << line << ":";
        for (size_t i = 0; i < 16; ++i) {
            os << ' ' << std::setw(2) << static_cast<int>(bytes[line + i]);
        }
        os << '\n';
    }

    os.flags(flags);
    os.fill(fill);
    return os;
}

} // namespace chipium
