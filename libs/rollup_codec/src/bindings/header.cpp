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

#include "extern.h"
#include "builder.h"
#include "commitment.h"
#include <cstdlib>

extern "C" {
int batch_header_load(
    void** out,
    const unsigned char* data,
    size_t size
) {
    if (!out || !data) return NULL_PARAMETER;

    Result<BatchHeader, int> res = BatchHeader::load(ConstByteSlice(data, size));
    if (res.is_err()) return res.unwrap_err();

    *out = new BatchHeader(std::move(res.unwrap()));
    return OK;
}

void batch_header_free(void* header) {
    delete reinterpret_cast<BatchHeader*>(header);
}

int batch_header_size(
    void* header,
    size_t* out
) {
    if (!header || !out) return NULL_PARAMETER;
    *out = reinterpret_cast<BatchHeader*>(header)->size();
    return OK;
}

int batch_header_get_u64(
    void* header,
    int field,
    uint64_t* out
) {
    if (!header || !out) return NULL_PARAMETER;
    if (!is_scalar_field(field)) return INVALID_FIELD;
    auto h = reinterpret_cast<BatchHeader*>(header);

    switch (field) {
    case VERSION:
        *out = h->get_version();
        return OK;
    case BATCH_INDEX:
        *out = h->get_batch_index();
        return OK;
    case L1_MESSAGE_POPPED:
        *out = h->get_l1_message_popped();
        return OK;
    case TOTAL_L1_MESSAGE_POPPED:
        *out = h->get_total_l1_message_popped();
        return OK;
    default:
        return h->get_last_block_number(out);
    }
}

int batch_header_get_hash(
    void* header,
    int field,
    Hash* out
) {
    if (!header || !out) return NULL_PARAMETER;
    if (!is_hash_field(field)) return INVALID_FIELD;
    auto h = reinterpret_cast<BatchHeader*>(header);

    *out = read_hash(h->bytes(), FIELD_SPANS[field].offset);
    return OK;
}

int batch_header_hash(
    void* header,
    Hash* out
) {
    if (!header || !out) return NULL_PARAMETER;
    *out = reinterpret_cast<BatchHeader*>(header)->hash();
    return OK;
}

int batch_header_encode(
    const BatchHeaderInput* in,
    void** out,
    size_t* out_size
) {
    if (!in || !out || !out_size) return NULL_PARAMETER;
    if (in->skipped_bitmap_size != 0 && !in->skipped_bitmap) return NULL_PARAMETER;

    BatchHeaderBuilder builder;
    builder.set_version(in->version);
    builder.set_batch_index(in->batch_index);
    builder.set_l1_message_popped(in->l1_message_popped);
    builder.set_total_l1_message_popped(in->total_l1_message_popped);
    builder.set_data_hash(in->data_hash);
    builder.set_blob_versioned_hash(in->blob_versioned_hash);
    builder.set_prev_state_hash(in->prev_state_hash);
    builder.set_post_state_hash(in->post_state_hash);
    builder.set_withdraw_root_hash(in->withdraw_root_hash);
    builder.set_sequencer_set_verify_hash(in->sequencer_set_verify_hash);
    builder.set_parent_batch_hash(in->parent_batch_hash);

    if (in->has_last_block_number)
        builder.set_last_block_number(in->last_block_number);
    if (in->skipped_bitmap_size != 0) {
        builder.set_skipped_bitmap(std::vector<byte>(
            in->skipped_bitmap, in->skipped_bitmap + in->skipped_bitmap_size));
    }

    Result<BatchHeader, int> res = builder.build();
    if (res.is_err()) return res.unwrap_err();
    const BatchHeader &header = res.unwrap();

    *out = malloc(header.size());
    *out_size = header.size();
    std::memcpy(*out, header.data(), header.size());
    return OK;
}

int batch_header_compute_hash(
    const unsigned char* data,
    size_t size,
    Hash* out
) {
    if (!data || !out) return NULL_PARAMETER;

    Result<Hash, int> res = compute_batch_hash(ConstByteSlice(data, size), size);
    if (res.is_err()) return res.unwrap_err();

    *out = res.unwrap();
    return OK;
}
}
