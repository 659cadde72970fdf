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

#include "chipium/FrameBuffer.hpp"

#include <algorithm>

namespace chipium {

FrameBuffer::FrameBuffer(DisplayChangedCallback on_change)
    : on_change_(std::move(on_change)) {
}

void FrameBuffer::clear() {
    std::fill(pixels_.begin(), pixels_.end(), 0);
    changed();
}

bool FrameBuffer::draw_sprite(uint8_t x, uint8_t y, std::span<const uint8_t> rows) {
    bool collision = false;

    for (size_t row = 0; row < rows.size(); ++row) {
        const uint8_t bits = rows[row];
        const size_t py = (y + row) % HEIGHT;

        for (size_t column = 0; column < 8; ++column) {
            if ((bits & (0x80 >> column)) == 0) {
                continue;
            }
            const size_t px = (x + column) % WIDTH;
            uint8_t& pixel = pixels_[py * WIDTH + px];
            if (pixel) {
                collision = true;
            }
            pixel ^= 1;
        }
    }

    changed();
    return collision;
}

size_t FrameBuffer::lit_count() const {
    return static_cast<size_t>(std::count(pixels_.begin(), pixels_.end(), uint8_t{1}));
}

void FrameBuffer::changed() {
    ++version_;
    if (on_change_) {
        on_change_();
    }
}

} // namespace chipium
