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

#include "chipium/Errors.hpp"

#include <iomanip>
#include <sstream>

namespace chipium {

namespace {

std::string describe_unimplemented(uint16_t opcode, uint16_t address) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0')
        << "Unimplemented instruction 0x" << std::setw(4) << opcode
        << " at address 0x" << std::setw(3) << address;
    return oss.str();
}

} // anonymous namespace

OutOfBounds::OutOfBounds(const std::string& what, uint32_t address, size_t length)
    : std::out_of_range(what)
    , address_(address)
    , length_(length) {
}

UnimplementedInstruction::UnimplementedInstruction(uint16_t opcode, uint16_t address)
    : std::runtime_error(describe_unimplemented(opcode, address))
    , opcode_(opcode)
    , address_(address) {
}

} // namespace chipium
