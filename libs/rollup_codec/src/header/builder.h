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
#include "writer.h"

// Assembles a complete header in one call. Values can be set in any order,
// build() performs the stores in the only safe order.
class BatchHeaderBuilder {
private:
    BatchHeaderFields fields_;

public:
    BatchHeaderBuilder() = default;
    explicit BatchHeaderBuilder(const BatchHeaderFields &fields) : fields_(fields) {}

    void set_version(uint8_t v) { fields_.version = v; }
    void set_batch_index(uint64_t v) { fields_.batch_index = v; }
    void set_l1_message_popped(uint64_t v) { fields_.l1_message_popped = v; }
    void set_total_l1_message_popped(uint64_t v) { fields_.total_l1_message_popped = v; }
    void set_data_hash(const Hash &h) { fields_.data_hash = h; }
    void set_blob_versioned_hash(const Hash &h) { fields_.blob_versioned_hash = h; }
    void set_prev_state_hash(const Hash &h) { fields_.prev_state_hash = h; }
    void set_post_state_hash(const Hash &h) { fields_.post_state_hash = h; }
    void set_withdraw_root_hash(const Hash &h) { fields_.withdraw_root_hash = h; }
    void set_sequencer_set_verify_hash(const Hash &h) { fields_.sequencer_set_verify_hash = h; }
    void set_parent_batch_hash(const Hash &h) { fields_.parent_batch_hash = h; }
    void set_last_block_number(uint64_t v) { fields_.last_block_number = v; }
    void set_skipped_bitmap(std::vector<byte> words) { fields_.skipped_bitmap = std::move(words); }

    const BatchHeaderFields& fields() const { return fields_; }

    // Encoded length for the current fields.
    size_t encoded_size() const;

    // UNSUPPORTED_VERSION when a trailing field does not belong to the
    // version, MALFORMED_HEADER for a bitmap that is not whole words.
    Result<BatchHeader, int> build() const;
};

inline Result<BatchHeader, int> build_batch_header(const BatchHeaderFields &fields) {
    return BatchHeaderBuilder(fields).build();
}
