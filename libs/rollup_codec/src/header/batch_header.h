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
#include "fields.h"
#include "result.h"
#include "skipped_bitmap.h"
#include <optional>
#include <vector>

// Decoded form of a header, also the input of BatchHeaderBuilder.
struct BatchHeaderFields {
    uint8_t  version = BATCH_VERSION_0;
    uint64_t batch_index = 0;
    uint64_t l1_message_popped = 0;
    uint64_t total_l1_message_popped = 0;

    Hash data_hash = new_hash();
    Hash blob_versioned_hash = new_hash();
    Hash prev_state_hash = new_hash();
    Hash post_state_hash = new_hash();
    Hash withdraw_root_hash = new_hash();
    Hash sequencer_set_verify_hash = new_hash();
    Hash parent_batch_hash = new_hash();

    // v1 only
    std::optional<uint64_t> last_block_number;
    // v0 only, raw uint256 words
    std::vector<byte> skipped_bitmap;

    bool operator==(const BatchHeaderFields& other) const = default;
};

// Owned copy of an encoded batch header. The buffer is never shorter than
// BATCH_HEADER_FIXED_LENGTH, so every fixed field accessor is in bounds.
// Bytes past the fixed part are kept verbatim and are part of the hash.
class BatchHeader {
private:
    std::vector<byte> buff_;

    explicit BatchHeader(std::vector<byte> buff);

public:
    // Copies raw, fails with MALFORMED_HEADER below the fixed length.
    static Result<BatchHeader, int> load(const ConstByteSlice &raw);

    // Zero filled buffer for assembly, same length rule as load.
    static Result<BatchHeader, int> allocate(size_t length);

    size_t size() const { return buff_.size(); }
    const byte* data() const { return buff_.data(); }
    ConstByteSlice bytes() const { return ConstByteSlice(buff_); }
    ByteSlice mut_bytes() { return ByteSlice(buff_); }
    ConstByteSlice trailing() const;

    uint8_t  get_version() const;
    uint64_t get_batch_index() const;
    uint64_t get_l1_message_popped() const;
    uint64_t get_total_l1_message_popped() const;
    Hash     get_data_hash() const;
    Hash     get_blob_versioned_hash() const;
    Hash     get_prev_state_hash() const;
    Hash     get_post_state_hash() const;
    Hash     get_withdraw_root_hash() const;
    Hash     get_sequencer_set_verify_hash() const;
    Hash     get_parent_batch_hash() const;

    int get_last_block_number(uint64_t* out) const;
    // The view borrows this header's bytes.
    Result<SkippedBitmap, int> get_skipped_bitmap() const &;
    Result<SkippedBitmap, int> get_skipped_bitmap() const && = delete;

    BatchHeaderFields fields() const;

    // Commitment over the whole buffer, trailing bytes included.
    Hash hash() const;

    bool operator==(const BatchHeader& other) const = default;
};

void print_header(const BatchHeader &header);
