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

#include "batch_header.h"
#include "commitment.h"
#include <cstdio>

BatchHeader::BatchHeader(std::vector<byte> buff) : buff_(std::move(buff)) {}

Result<BatchHeader, int> BatchHeader::load(const ConstByteSlice &raw) {
    if (raw.size() < BATCH_HEADER_FIXED_LENGTH) return MALFORMED_HEADER;
    return BatchHeader(std::vector<byte>(raw.begin(), raw.end()));
}

Result<BatchHeader, int> BatchHeader::allocate(size_t length) {
    if (length < BATCH_HEADER_FIXED_LENGTH) return MALFORMED_HEADER;
    return BatchHeader(std::vector<byte>(length, 0));
}

ConstByteSlice BatchHeader::trailing() const {
    return bytes().subspan(BATCH_HEADER_FIXED_LENGTH);
}

uint8_t BatchHeader::get_version() const { return load_version(bytes()); }

uint64_t BatchHeader::get_batch_index() const { return load_batch_index(bytes()); }

uint64_t BatchHeader::get_l1_message_popped() const {
    return load_l1_message_popped(bytes());
}

uint64_t BatchHeader::get_total_l1_message_popped() const {
    return load_total_l1_message_popped(bytes());
}

Hash BatchHeader::get_data_hash() const { return load_data_hash(bytes()); }

Hash BatchHeader::get_blob_versioned_hash() const {
    return load_blob_versioned_hash(bytes());
}

Hash BatchHeader::get_prev_state_hash() const { return load_prev_state_hash(bytes()); }

Hash BatchHeader::get_post_state_hash() const { return load_post_state_hash(bytes()); }

Hash BatchHeader::get_withdraw_root_hash() const {
    return load_withdraw_root_hash(bytes());
}

Hash BatchHeader::get_sequencer_set_verify_hash() const {
    return load_sequencer_set_verify_hash(bytes());
}

Hash BatchHeader::get_parent_batch_hash() const {
    return load_parent_batch_hash(bytes());
}

int BatchHeader::get_last_block_number(uint64_t* out) const {
    if (get_version() < BATCH_VERSION_1) return UNSUPPORTED_VERSION;
    if (size() < BATCH_HEADER_V1_LENGTH) return MALFORMED_HEADER;

    *out = read_u64(bytes(), LAST_BLOCK_NUMBER_OFF);
    return OK;
}

Result<SkippedBitmap, int> BatchHeader::get_skipped_bitmap() const & {
    if (get_version() != BATCH_VERSION_0) return UNSUPPORTED_VERSION;

    ConstByteSlice words = trailing();
    if (words.size() % SKIPPED_BITMAP_WORD_SIZE != 0) return MALFORMED_HEADER;
    return SkippedBitmap(words);
}

BatchHeaderFields BatchHeader::fields() const {
    BatchHeaderFields f;
    f.version = get_version();
    f.batch_index = get_batch_index();
    f.l1_message_popped = get_l1_message_popped();
    f.total_l1_message_popped = get_total_l1_message_popped();

    f.data_hash = get_data_hash();
    f.blob_versioned_hash = get_blob_versioned_hash();
    f.prev_state_hash = get_prev_state_hash();
    f.post_state_hash = get_post_state_hash();
    f.withdraw_root_hash = get_withdraw_root_hash();
    f.sequencer_set_verify_hash = get_sequencer_set_verify_hash();
    f.parent_batch_hash = get_parent_batch_hash();

    uint64_t last_block = 0;
    if (get_last_block_number(&last_block) == OK) {
        f.last_block_number = last_block;
    } else if (f.version == BATCH_VERSION_0) {
        ConstByteSlice words = trailing();
        f.skipped_bitmap.assign(words.begin(), words.end());
    }
    return f;
}

Hash BatchHeader::hash() const {
    return compute_batch_hash(bytes(), size()).unwrap();
}

void print_header(const BatchHeader &header) {
    printf("batch header, %zu bytes\n", header.size());
    printf("  version:                %u\n", unsigned(header.get_version()));
    printf("  batchIndex:             %llu\n",
        (unsigned long long)header.get_batch_index());
    printf("  l1MessagePopped:        %llu\n",
        (unsigned long long)header.get_l1_message_popped());
    printf("  totalL1MessagePopped:   %llu\n",
        (unsigned long long)header.get_total_l1_message_popped());
    printf("  dataHash:               %s\n",
        hash_to_hex(header.get_data_hash()).c_str());
    printf("  blobVersionedHash:      %s\n",
        hash_to_hex(header.get_blob_versioned_hash()).c_str());
    printf("  prevStateHash:          %s\n",
        hash_to_hex(header.get_prev_state_hash()).c_str());
    printf("  postStateHash:          %s\n",
        hash_to_hex(header.get_post_state_hash()).c_str());
    printf("  withdrawRootHash:       %s\n",
        hash_to_hex(header.get_withdraw_root_hash()).c_str());
    printf("  sequencerSetVerifyHash: %s\n",
        hash_to_hex(header.get_sequencer_set_verify_hash()).c_str());
    printf("  parentBatchHash:        %s\n",
        hash_to_hex(header.get_parent_batch_hash()).c_str());

    uint64_t last_block = 0;
    if (header.get_last_block_number(&last_block) == OK) {
        printf("  lastBlockNumber:        %llu\n", (unsigned long long)last_block);
    }
    printf("  commitment:             %s\n", hash_to_hex(header.hash()).c_str());
}
