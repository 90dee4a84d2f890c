/*
 * Rollup Codec
 * Copyright (C) 2025 Joshua Olson
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "skipped_bitmap.h"
#include <bit>

SkippedBitmap::SkippedBitmap(const ConstByteSlice &words) : words_(words) {}

bool SkippedBitmap::is_skipped(uint64_t index) const {
    check_index(index);
    size_t word = index / WORD_BITS;
    size_t bit = index % WORD_BITS;

    // bit 0 is the least significant bit, which sits in the last byte
    size_t byte_index = word * SKIPPED_BITMAP_WORD_SIZE
        + (SKIPPED_BITMAP_WORD_SIZE - 1 - bit / 8);
    return (words_[byte_index] & (uint8_t(1) << (bit % 8))) != 0;
}

size_t SkippedBitmap::count() const {
    size_t c = 0;
    for (byte b : words_) {
        c += std::popcount(b);
    }
    return c;
}

void SkippedBitmap::check_index(uint64_t index) const {
    if (index >= bit_size())
        throw std::out_of_range("Skipped bitmap index out of range");
}
