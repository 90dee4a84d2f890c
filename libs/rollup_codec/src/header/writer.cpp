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

#include "writer.h"
#include <iterator>

HeaderWriter::HeaderWriter(BatchHeader &header, WriterOptions opts)
    : buff_(header.mut_bytes())
    , opts_(opts)
    , written_(initial_mask(opts))
{}

HeaderWriter::HeaderWriter(const ByteSlice &buff, WriterOptions opts)
    : buff_(buff)
    , opts_(opts)
    , written_(initial_mask(opts))
{}

uint16_t HeaderWriter::initial_mask(WriterOptions opts) {
    if (opts.fresh_buffer) return 0;
    return (uint16_t(1) << FIXED_FIELD_COUNT) - 1;
}

int HeaderWriter::check_order(HeaderField field) const {
    if (!opts_.enforce_order) return OK;

    const size_t offset = FIELD_SPANS[field].offset;
    for (size_t f = 0; f < std::size(FIELD_SPANS); f++) {
        if (is_written(static_cast<HeaderField>(f)) && FIELD_SPANS[f].offset > offset)
            return ORDERING_VIOLATION;
    }
    return OK;
}

int HeaderWriter::store_word_field(HeaderField field, uint64_t v) {
    int rc = check_order(field);
    if (rc != OK) return rc;

    store_word_u64(buff_, FIELD_SPANS[field].offset, v);
    written_ |= uint16_t(1) << field;
    return OK;
}

int HeaderWriter::store_hash_field(HeaderField field, const Hash &h) {
    store_hash(buff_, FIELD_SPANS[field].offset, h);
    written_ |= uint16_t(1) << field;
    return OK;
}

int HeaderWriter::set_version(uint8_t v) {
    store_u8(buff_, VERSION_OFF, v);
    written_ |= uint16_t(1) << VERSION;
    return OK;
}

int HeaderWriter::set_batch_index(uint64_t v) {
    return store_word_field(BATCH_INDEX, v);
}

int HeaderWriter::set_l1_message_popped(uint64_t v) {
    return store_word_field(L1_MESSAGE_POPPED, v);
}

int HeaderWriter::set_total_l1_message_popped(uint64_t v) {
    return store_word_field(TOTAL_L1_MESSAGE_POPPED, v);
}

int HeaderWriter::set_data_hash(const Hash &h) {
    return store_hash_field(DATA_HASH, h);
}

int HeaderWriter::set_blob_versioned_hash(const Hash &h) {
    return store_hash_field(BLOB_VERSIONED_HASH, h);
}

int HeaderWriter::set_prev_state_hash(const Hash &h) {
    return store_hash_field(PREV_STATE_HASH, h);
}

int HeaderWriter::set_post_state_hash(const Hash &h) {
    return store_hash_field(POST_STATE_HASH, h);
}

int HeaderWriter::set_withdraw_root_hash(const Hash &h) {
    return store_hash_field(WITHDRAW_ROOT_HASH, h);
}

int HeaderWriter::set_sequencer_set_verify_hash(const Hash &h) {
    return store_hash_field(SEQUENCER_SET_VERIFY_HASH, h);
}

int HeaderWriter::set_parent_batch_hash(const Hash &h) {
    return store_hash_field(PARENT_BATCH_HASH, h);
}

int HeaderWriter::set_last_block_number(uint64_t v) {
    check_range(buff_.size(), LAST_BLOCK_NUMBER_OFF, U64_SIZE);
    // v0 keeps the skipped bitmap here
    if (load_version(buff_) < BATCH_VERSION_1) return UNSUPPORTED_VERSION;
    return store_word_field(LAST_BLOCK_NUMBER, v);
}

int HeaderWriter::set_skipped_bitmap(const ConstByteSlice &words) {
    if (words.size() % SKIPPED_BITMAP_WORD_SIZE != 0) return MALFORMED_HEADER;
    check_range(buff_.size(), SKIPPED_BITMAP_OFF, words.size());
    if (load_version(buff_) != BATCH_VERSION_0) return UNSUPPORTED_VERSION;

    if (!words.empty())
        std::memcpy(buff_.data() + SKIPPED_BITMAP_OFF, words.data(), words.size());
    return OK;
}

bool HeaderWriter::is_written(HeaderField field) const {
    return (written_ & (uint16_t(1) << field)) != 0;
}

bool HeaderWriter::is_complete() const {
    const uint16_t fixed_mask = (uint16_t(1) << FIXED_FIELD_COUNT) - 1;
    return (written_ & fixed_mask) == fixed_mask;
}
