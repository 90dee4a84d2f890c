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

// extern.h
#pragma once
#include "hashing.h"
#include <cstddef>
#include <cstdint>

extern "C" {
    struct BatchHeaderInput {
        uint8_t version;
        uint64_t batch_index;
        uint64_t l1_message_popped;
        uint64_t total_l1_message_popped;

        Hash data_hash;
        Hash blob_versioned_hash;
        Hash prev_state_hash;
        Hash post_state_hash;
        Hash withdraw_root_hash;
        Hash sequencer_set_verify_hash;
        Hash parent_batch_hash;

        // v1, ignored unless has_last_block_number != 0
        uint8_t has_last_block_number;
        uint64_t last_block_number;

        // v0, may be null when size is 0
        const unsigned char* skipped_bitmap;
        size_t skipped_bitmap_size;
    };

    // copies data, release with batch_header_free
    int batch_header_load(
        void** out,
        const unsigned char* data,
        size_t size
    );

    void batch_header_free(void* header);

    int batch_header_size(
        void* header,
        size_t* out
    );

    // field is a HeaderField, version is widened
    int batch_header_get_u64(
        void* header,
        int field,
        uint64_t* out
    );

    int batch_header_get_hash(
        void* header,
        int field,
        Hash* out
    );

    int batch_header_hash(
        void* header,
        Hash* out
    );

    // *out is malloc'ed, the caller frees it
    int batch_header_encode(
        const BatchHeaderInput* in,
        void** out,
        size_t* out_size
    );

    int batch_header_compute_hash(
        const unsigned char* data,
        size_t size,
        Hash* out
    );
}
