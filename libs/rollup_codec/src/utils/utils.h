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
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

using byte = uint8_t;

using ByteSlice = std::span<byte>;
using ConstByteSlice = std::span<const byte>;

inline void check_range(size_t size, size_t offset, size_t width) {
    if (offset > size || width > size - offset)
        throw std::out_of_range("Field range out of buffer");
}

inline uint64_t load_be64(const byte* cursor) {
    uint64_t v = 0;
    for (size_t i = 0; i < sizeof(v); i++) {
        v = (v << 8) | cursor[i];
    }
    return v;
}

inline void store_be64(byte* cursor, uint64_t v) {
    for (size_t i = sizeof(v); i-- > 0;) {
        cursor[i] = static_cast<byte>(v);
        v >>= 8;
    }
}
