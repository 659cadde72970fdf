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

#ifndef CHIPIUM_FRAME_BUFFER_HPP
#define CHIPIUM_FRAME_BUFFER_HPP

#include "Types.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace chipium {

// Called after every mutation of the pixel grid
using DisplayChangedCallback = std::function<void()>;

// 64x32 monochrome pixel grid.
//
// Mutated only by clear() and draw_sprite(). Both raise the display-changed
// callback and bump version() once they have finished.
//
// Thread safety: none. The owning Processor is driven by Machine, which
// serialises all access.
class FrameBuffer {
public:
    static constexpr size_t WIDTH = kDisplayWidth;
    static constexpr size_t HEIGHT = kDisplayHeight;

    explicit FrameBuffer(DisplayChangedCallback on_change = nullptr);

    // Non-copyable, non-movable
    FrameBuffer(const FrameBuffer&) = delete;
    FrameBuffer& operator=(const FrameBuffer&) = delete;
    FrameBuffer(FrameBuffer&&) = delete;
    FrameBuffer& operator=(FrameBuffer&&) = delete;

    // Turn every pixel off
    void clear();

    // XOR an 8-pixel-wide sprite, one byte per row with the most significant
    // bit leftmost. Coordinates wrap around both edges rather than clipping.
    // Returns true if any pixel was turned off (collision).
    bool draw_sprite(uint8_t x, uint8_t y, std::span<const uint8_t> rows);

    // --- Query interface ---

    bool pixel(size_t x, size_t y) const {
        return pixels_[(y % HEIGHT) * WIDTH + (x % WIDTH)] != 0;
    }

    // Row-major copy, one byte per pixel (0 or 1)
    std::vector<uint8_t> snapshot() const {
        return std::vector<uint8_t>(pixels_.begin(), pixels_.end());
    }

    // Number of pixels currently on
    size_t lit_count() const;

    // Incremented on every mutation
    uint64_t version() const { return version_; }

    size_t width() const { return WIDTH; }
    size_t height() const { return HEIGHT; }
    size_t pixel_count() const { return WIDTH * HEIGHT; }

private:
    void changed();

    std::array<uint8_t, kDisplayWidth * kDisplayHeight> pixels_{};
    DisplayChangedCallback on_change_;
    uint64_t version_ = 0;
};

} // namespace chipium

#endif // CHIPIUM_FRAME_BUFFER_HPP
