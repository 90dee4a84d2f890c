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
#include "hashing.h"
#include "layout.h"

// Readers over a raw buffer. They do not assume the buffer went through
// the loader and throw std::out_of_range when a field does not fit.

uint8_t  read_u8(const ConstByteSlice &buff, size_t offset);
uint64_t read_u64(const ConstByteSlice &buff, size_t offset);
Hash     read_hash(const ConstByteSlice &buff, size_t offset);

uint8_t  load_version(const ConstByteSlice &buff);
uint64_t load_batch_index(const ConstByteSlice &buff);
uint64_t load_l1_message_popped(const ConstByteSlice &buff);
uint64_t load_total_l1_message_popped(const ConstByteSlice &buff);
Hash     load_data_hash(const ConstByteSlice &buff);
Hash     load_blob_versioned_hash(const ConstByteSlice &buff);
Hash     load_prev_state_hash(const ConstByteSlice &buff);
Hash     load_post_state_hash(const ConstByteSlice &buff);
Hash     load_withdraw_root_hash(const ConstByteSlice &buff);
Hash     load_sequencer_set_verify_hash(const ConstByteSlice &buff);
Hash     load_parent_batch_hash(const ConstByteSlice &buff);


// Word stores, matching the settlement contract's memory writes.
//
// store_word_u64 writes the value big-endian into the first 8 bytes of a
// 32-byte window at offset and zeroes the other 24. Anything already in
// that window is lost, so narrow fields must be stored in ascending offset
// order. The window is clipped at the end of the buffer, but the 8 value
// bytes themselves must fit.
void store_u8(const ByteSlice &buff, size_t offset, uint8_t v);
void store_word_u64(const ByteSlice &buff, size_t offset, uint64_t v);
void store_hash(const ByteSlice &buff, size_t offset, const Hash &h);
