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

#pragma once
#include "layout.h"

// Read view over a version 0 skippedL1MessageBitmap. The bitmap is an array
// of big-endian uint256 words, bit i of word j flags L1 message j * 256 + i
// of the batch as skipped. The view borrows the header's bytes.
class SkippedBitmap {
public:
    static constexpr size_t WORD_BITS = SKIPPED_BITMAP_WORD_SIZE * 8;

    explicit SkippedBitmap(const ConstByteSlice &words);

    size_t word_count() const { return words_.size() / SKIPPED_BITMAP_WORD_SIZE; }
    size_t bit_size() const { return word_count() * WORD_BITS; }

    bool is_skipped(uint64_t index) const;
    size_t count() const;

private:
    ConstByteSlice words_;

    void check_index(uint64_t index) const;
};
