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

struct WriterOptions {
    // Reject a word store that would zero an already written field.
    // Off reproduces the contract's silent overwrite byte for byte.
    bool enforce_order = true;
    // The buffer holds no fields yet, as straight from BatchHeader::allocate.
    // Otherwise every fixed field counts as written from the start.
    bool fresh_buffer = false;
};

// Field writer with the settlement contract's store semantics.
//
// batchIndex, l1MessagePopped, totalL1MessagePopped and lastBlockNumber are
// stored as full 32-byte words: value in the first 8 bytes, zeros after.
// The only safe order is
//
//     version, batchIndex, l1MessagePopped, totalL1MessagePopped,
//     then the 32-byte fields in any order.
//
// version is a single byte and can be written at any point.
//
// With enforce_order set, a word store issued after a field at a higher
// offset has been written returns ORDERING_VIOLATION and leaves the buffer
// untouched. Unless the buffer is marked fresh, the fixed fields already in
// it count as written. Fields outside the buffer throw std::out_of_range.
//
// The trailing setters check the version byte: lastBlockNumber needs
// version 1 or later and the skipped bitmap needs version 0, otherwise
// UNSUPPORTED_VERSION.
class HeaderWriter {
private:
    ByteSlice buff_;
    WriterOptions opts_;
    uint16_t written_;

    int check_order(HeaderField field) const;
    int store_word_field(HeaderField field, uint64_t v);
    int store_hash_field(HeaderField field, const Hash &h);
    static uint16_t initial_mask(WriterOptions opts);

public:
    explicit HeaderWriter(BatchHeader &header, WriterOptions opts = {});
    explicit HeaderWriter(const ByteSlice &buff, WriterOptions opts = {});

    int set_version(uint8_t v);
    int set_batch_index(uint64_t v);
    int set_l1_message_popped(uint64_t v);
    int set_total_l1_message_popped(uint64_t v);
    int set_data_hash(const Hash &h);
    int set_blob_versioned_hash(const Hash &h);
    int set_prev_state_hash(const Hash &h);
    int set_post_state_hash(const Hash &h);
    int set_withdraw_root_hash(const Hash &h);
    int set_sequencer_set_verify_hash(const Hash &h);
    int set_parent_batch_hash(const Hash &h);

    int set_last_block_number(uint64_t v);
    // raw uint256 words after the fixed part, size must be a multiple of 32
    int set_skipped_bitmap(const ConstByteSlice &words);

    bool is_written(HeaderField field) const;
    // all fixed fields written
    bool is_complete() const;
};
