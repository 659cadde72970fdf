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

#ifndef CHIPIUM_HOST_INTERFACES_HPP
#define CHIPIUM_HOST_INTERFACES_HPP

#include <cstdint>

namespace chipium {

class UnimplementedInstruction;

// Key state queried by the processor (EX9E, EXA1 and while awaiting a key).
class InputCapability {
public:
    virtual ~InputCapability() = default;

    // key is 0-15; keys outside the pad report not pressed
    virtual bool is_key_pressed(uint8_t key) const = 0;
};

// Events the processor raises towards its host.
class HostNotifier {
public:
    virtual ~HostNotifier() = default;

    // The framebuffer was cleared or drawn to
    virtual void display_changed() = 0;

    // A jump targeted its own address. Advisory: the host may pause.
    virtual void halt_recommended(uint16_t address) = 0;

    // Decode failed. Raised before step() throws the same error.
    virtual void emulation_error(const UnimplementedInstruction& error) = 0;
};

} // namespace chipium

#endif // CHIPIUM_HOST_INTERFACES_HPP
