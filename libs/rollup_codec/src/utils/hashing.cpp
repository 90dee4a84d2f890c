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

#include "hashing.h"
#include <ethash/keccak.hpp>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>

Hash derive_hash(const ConstByteSlice &value) {
    const ethash::hash256 digest = ethash::keccak256(value.data(), value.size());
    return new_hash(digest.bytes);
}

Hash new_hash(const byte* h) {
    Hash hash;
    if (h != nullptr) {
        std::memcpy(hash.h, h, 32);
    } else {
        std::memset(hash.h, 0, 32);
    }
    return hash;
}

bool hash_is_zero(const Hash &hash) {
    for (byte b : hash.h) {
        if (b != 0) return false;
    }
    return true;
}

void seeded_hash(Hash* out, int i) {
    std::mt19937_64 gen(i);            // 64-bit PRNG
    std::uniform_int_distribution<uint64_t> dist;

    for (i = 0; i < 4; ++i) {        // 4 * 8 bytes = 32 bytes
        uint64_t num = dist(gen);
        for (int j{} ; j < 8; ++j) {
            out->h[i*8 + j] = static_cast<byte>((num >> (8 * j)) & 0xFF);
        }
    }
}

std::string hash_to_hex(const Hash &hash) {
    std::ostringstream os;
    os << "0x";
    for (byte b : hash.h) {
        os << std::hex
           << std::setw(2)
           << std::setfill('0')
           << static_cast<unsigned>(b);
    }
    return os.str();
}

void print_hash(const Hash &hash) {
    std::cout << hash_to_hex(hash) << std::endl;
}
