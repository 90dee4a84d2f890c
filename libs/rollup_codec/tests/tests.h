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
#include "batch_header.h"
#include <string>
#include <vector>

void main_layout();
void main_reader();
void main_writer();
void main_hashing();
void main_builder();
void main_bindings();

inline Hash pattern_hash(byte seed) {
    Hash h;
    for (size_t i = 0; i < sizeof(h.h); i++) {
        h.h[i] = static_cast<byte>(seed + i);
    }
    return h;
}

inline Hash hash_from_hex(const std::string& hex) {
    Hash h = new_hash();
    for (size_t i = 0; i < 32 && 2 * i + 1 < hex.size(); i++) {
        h.h[i] = static_cast<byte>(std::stoi(hex.substr(2 * i, 2), nullptr, 16));
    }
    return h;
}

inline void append_u64(std::vector<byte>& out, uint64_t v) {
    for (int i = 7; i >= 0; i--) {
        out.push_back(static_cast<byte>(v >> (8 * i)));
    }
}

inline void append_hash(std::vector<byte>& out, const Hash& h) {
    out.insert(out.end(), h.h, h.h + sizeof(h.h));
}

// version 0, batch 12345, 10 popped of 500 total, distinct hash patterns
inline BatchHeaderFields scenario_fields() {
    BatchHeaderFields f;
    f.version = 0;
    f.batch_index = 12345;
    f.l1_message_popped = 10;
    f.total_l1_message_popped = 500;
    f.data_hash = pattern_hash(0x10);
    f.blob_versioned_hash = pattern_hash(0x30);
    f.prev_state_hash = pattern_hash(0x50);
    f.post_state_hash = pattern_hash(0x70);
    f.withdraw_root_hash = pattern_hash(0x90);
    f.sequencer_set_verify_hash = pattern_hash(0xb0);
    f.parent_batch_hash = pattern_hash(0xd0);
    return f;
}

// Same bytes as the builder should produce, by plain concatenation.
inline std::vector<byte> concat_fields(const BatchHeaderFields& f) {
    std::vector<byte> out;
    out.push_back(f.version);
    append_u64(out, f.batch_index);
    append_u64(out, f.l1_message_popped);
    append_u64(out, f.total_l1_message_popped);
    append_hash(out, f.data_hash);
    append_hash(out, f.blob_versioned_hash);
    append_hash(out, f.prev_state_hash);
    append_hash(out, f.post_state_hash);
    append_hash(out, f.withdraw_root_hash);
    append_hash(out, f.sequencer_set_verify_hash);
    append_hash(out, f.parent_batch_hash);
    if (f.last_block_number.has_value()) append_u64(out, *f.last_block_number);
    out.insert(out.end(), f.skipped_bitmap.begin(), f.skipped_bitmap.end());
    return out;
}
