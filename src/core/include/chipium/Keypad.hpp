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

#pragma once

#include "HostInterfaces.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstdint>

namespace chipium {

// 16-key hexadecimal keypad.
//
// Written by gRPC threads, read by the emulation thread, so the whole pad is
// a single atomic bitmask (bit N set means key N is down).
class Keypad final : public InputCapability {
public:
    static constexpr uint8_t NUM_KEYS = kKeyCount;

    // Set a key as pressed (thread-safe)
    void key_down(uint8_t key) {
        if (key < NUM_KEYS) {
            keys_.fetch_or(static_cast<uint16_t>(1u << key), std::memory_order_release);
        }
    }

    // Set a key as released (thread-safe)
    void key_up(uint8_t key) {
        if (key < NUM_KEYS) {
            keys_.fetch_and(static_cast<uint16_t>(~(1u << key)), std::memory_order_release);
        }
    }

    bool is_key_pressed(uint8_t key) const override {
        if (key < NUM_KEYS) {
            return (keys_.load(std::memory_order_acquire) & (1u << key)) != 0;
        }
        return false;
    }

    // Snapshot of all keys, bit per key
    uint16_t state() const {
        return keys_.load(std::memory_order_acquire);
    }

    void clear() {
        keys_.store(0, std::memory_order_release);
    }

private:
    std::atomic<uint16_t> keys_{0};
};

} // namespace chipium
