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

#include "builder.h"

size_t BatchHeaderBuilder::encoded_size() const {
    if (fields_.last_block_number.has_value()) return BATCH_HEADER_V1_LENGTH;
    return BATCH_HEADER_FIXED_LENGTH + fields_.skipped_bitmap.size();
}

Result<BatchHeader, int> BatchHeaderBuilder::build() const {
    const BatchHeaderFields &f = fields_;

    if (f.last_block_number.has_value() && f.version < BATCH_VERSION_1)
        return UNSUPPORTED_VERSION;
    if (!f.skipped_bitmap.empty() && f.version != BATCH_VERSION_0)
        return UNSUPPORTED_VERSION;
    if (f.skipped_bitmap.size() % SKIPPED_BITMAP_WORD_SIZE != 0)
        return MALFORMED_HEADER;

    Result<BatchHeader, int> res = BatchHeader::allocate(encoded_size());
    if (res.is_err()) return res.unwrap_err();
    BatchHeader header = std::move(res.unwrap());

    HeaderWriter w(header, WriterOptions{true, true});
    int rc = OK;

    // narrow fields first, ascending offset
    if (rc == OK) rc = w.set_version(f.version);
    if (rc == OK) rc = w.set_batch_index(f.batch_index);
    if (rc == OK) rc = w.set_l1_message_popped(f.l1_message_popped);
    if (rc == OK) rc = w.set_total_l1_message_popped(f.total_l1_message_popped);

    if (rc == OK) rc = w.set_data_hash(f.data_hash);
    if (rc == OK) rc = w.set_blob_versioned_hash(f.blob_versioned_hash);
    if (rc == OK) rc = w.set_prev_state_hash(f.prev_state_hash);
    if (rc == OK) rc = w.set_post_state_hash(f.post_state_hash);
    if (rc == OK) rc = w.set_withdraw_root_hash(f.withdraw_root_hash);
    if (rc == OK) rc = w.set_sequencer_set_verify_hash(f.sequencer_set_verify_hash);
    if (rc == OK) rc = w.set_parent_batch_hash(f.parent_batch_hash);

    if (rc == OK && f.last_block_number.has_value())
        rc = w.set_last_block_number(*f.last_block_number);
    if (rc == OK && !f.skipped_bitmap.empty())
        rc = w.set_skipped_bitmap(f.skipped_bitmap);

    if (rc != OK) return rc;
    return header;
}
