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

#ifndef CHIPIUM_ERRORS_HPP
#define CHIPIUM_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace chipium {

// A memory or call stack access fell outside its store.
// The operation that raised it has not been partially applied.
class OutOfBounds : public std::out_of_range {
public:
    OutOfBounds(const std::string& what, uint32_t address, size_t length);

    uint32_t address() const noexcept { return address_; }
    size_t length() const noexcept { return length_; }

private:
    uint32_t address_;
    size_t length_;
};

// Decode found no instruction for the fetched word. Fatal to continued execution.
class UnimplementedInstruction : public std::runtime_error {
public:
    UnimplementedInstruction(uint16_t opcode, uint16_t address);

    uint16_t opcode() const noexcept { return opcode_; }
    uint16_t address() const noexcept { return address_; }

private:
    uint16_t opcode_;
    uint16_t address_;
};

} // namespace chipium

#endif // CHIPIUM_ERRORS_HPP
