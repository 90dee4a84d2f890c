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

#include "fields.h"
#include <algorithm>

uint8_t read_u8(const ConstByteSlice &buff, size_t offset) {
    check_range(buff.size(), offset, 1);
    return buff[offset];
}

uint64_t read_u64(const ConstByteSlice &buff, size_t offset) {
    check_range(buff.size(), offset, U64_SIZE);
    return load_be64(buff.data() + offset);
}

Hash read_hash(const ConstByteSlice &buff, size_t offset) {
    check_range(buff.size(), offset, HASH_SIZE);
    return new_hash(buff.data() + offset);
}

uint8_t load_version(const ConstByteSlice &buff) {
    return read_u8(buff, VERSION_OFF);
}

uint64_t load_batch_index(const ConstByteSlice &buff) {
    return read_u64(buff, BATCH_INDEX_OFF);
}

uint64_t load_l1_message_popped(const ConstByteSlice &buff) {
    return read_u64(buff, L1_MSG_POPPED_OFF);
}

uint64_t load_total_l1_message_popped(const ConstByteSlice &buff) {
    return read_u64(buff, TOTAL_L1_MSG_POPPED_OFF);
}

Hash load_data_hash(const ConstByteSlice &buff) {
    return read_hash(buff, DATA_HASH_OFF);
}

Hash load_blob_versioned_hash(const ConstByteSlice &buff) {
    return read_hash(buff, BLOB_VERSIONED_HASH_OFF);
}

Hash load_prev_state_hash(const ConstByteSlice &buff) {
    return read_hash(buff, PREV_STATE_HASH_OFF);
}

Hash load_post_state_hash(const ConstByteSlice &buff) {
    return read_hash(buff, POST_STATE_HASH_OFF);
}

Hash load_withdraw_root_hash(const ConstByteSlice &buff) {
    return read_hash(buff, WITHDRAW_ROOT_HASH_OFF);
}

Hash load_sequencer_set_verify_hash(const ConstByteSlice &buff) {
    return read_hash(buff, SEQUENCER_SET_VERIFY_HASH_OFF);
}

Hash load_parent_batch_hash(const ConstByteSlice &buff) {
    return read_hash(buff, PARENT_BATCH_HASH_OFF);
}


void store_u8(const ByteSlice &buff, size_t offset, uint8_t v) {
    check_range(buff.size(), offset, 1);
    buff[offset] = v;
}

void store_word_u64(const ByteSlice &buff, size_t offset, uint64_t v) {
    check_range(buff.size(), offset, U64_SIZE);

    byte* cursor = buff.data() + offset;
    store_be64(cursor, v);

    size_t window_end = std::min(offset + WORD_SIZE, buff.size());
    std::fill(cursor + U64_SIZE, buff.data() + window_end, byte{0});
}

void store_hash(const ByteSlice &buff, size_t offset, const Hash &h) {
    check_range(buff.size(), offset, HASH_SIZE);
    std::memcpy(buff.data() + offset, h.h, HASH_SIZE);
}
