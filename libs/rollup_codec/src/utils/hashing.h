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
#include "utils.h"
#include <cstring>
#include <string>

struct Hash {
    byte h[32];

    bool operator==(const Hash& other) const noexcept {
        return std::memcmp(h, other.h, sizeof(h)) == 0;
    }
    bool operator!=(const Hash& other) const noexcept {
        return !(*this == other);
    }
};

// keccak256, legacy padding (as used by the EVM)
Hash derive_hash(const ConstByteSlice &value);

Hash new_hash(const byte* h = nullptr);
bool hash_is_zero(const Hash &hash);
void seeded_hash(Hash* out, int i);

std::string hash_to_hex(const Hash &hash);
void print_hash(const Hash &hash);
