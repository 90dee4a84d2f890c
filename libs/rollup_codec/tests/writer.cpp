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

#include <algorithm>
#include <cassert>
#include <cstdio>
#include <stdexcept>
#include "writer.h"
#include "tests.h"

// strict writer over a zeroed buffer from allocate
static const WriterOptions FRESH{true, true};

static bool all_equal(const BatchHeader &header, size_t begin, size_t end, byte v) {
    ConstByteSlice b = header.bytes();
    return std::all_of(b.begin() + begin, b.begin() + end, [v](byte x) { return x == v; });
}

// Legacy layout: the totalL1MessagePopped bytes [17, 25) sit inside the
// word written for l1MessagePopped [9, 41).
void test_ordering_hazard() {
    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH).unwrap();
    HeaderWriter w(header, WriterOptions{false});

    assert(w.set_version(0) == OK);
    assert(w.set_batch_index(12345) == OK);
    assert(w.set_total_l1_message_popped(500) == OK);
    assert(header.get_total_l1_message_popped() == 500);

    assert(w.set_l1_message_popped(10) == OK);
    assert(header.get_l1_message_popped() == 10);
    assert(header.get_total_l1_message_popped() == 0);
    assert(all_equal(header, TOTAL_L1_MSG_POPPED_OFF, DATA_HASH_OFF, 0));
    printf("OUT OF ORDER WRITE ZEROED totalL1MessagePopped. \n");
}

void test_word_windows() {
    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH).unwrap();
    ByteSlice b = header.mut_bytes();
    HeaderWriter w(header, WriterOptions{false});

    // batchIndex rewrites [1, 33)
    std::fill(b.begin(), b.end(), byte{0xff});
    assert(w.set_batch_index(1) == OK);
    assert(header.get_version() == 0xff);
    assert(header.get_batch_index() == 1);
    assert(all_equal(header, L1_MSG_POPPED_OFF, BATCH_INDEX_OFF + WORD_SIZE, 0));
    assert(all_equal(header, BATCH_INDEX_OFF + WORD_SIZE, BATCH_HEADER_FIXED_LENGTH, 0xff));
    // first 8 bytes of dataHash
    assert(header.get_data_hash().h[7] == 0);
    assert(header.get_data_hash().h[8] == 0xff);

    // l1MessagePopped rewrites [9, 41), the first 16 bytes of dataHash
    std::fill(b.begin(), b.end(), byte{0xff});
    assert(w.set_l1_message_popped(2) == OK);
    assert(all_equal(header, BATCH_INDEX_OFF, L1_MSG_POPPED_OFF, 0xff));
    assert(all_equal(header, TOTAL_L1_MSG_POPPED_OFF, L1_MSG_POPPED_OFF + WORD_SIZE, 0));
    assert(all_equal(header, L1_MSG_POPPED_OFF + WORD_SIZE, BATCH_HEADER_FIXED_LENGTH, 0xff));

    // totalL1MessagePopped rewrites [17, 49), blobVersionedHash untouched
    std::fill(b.begin(), b.end(), byte{0xff});
    assert(w.set_total_l1_message_popped(3) == OK);
    assert(header.get_total_l1_message_popped() == 3);
    assert(all_equal(header, DATA_HASH_OFF, TOTAL_L1_MSG_POPPED_OFF + WORD_SIZE, 0));
    assert(all_equal(header, TOTAL_L1_MSG_POPPED_OFF + WORD_SIZE, BATCH_HEADER_FIXED_LENGTH, 0xff));

    // 32-byte fields write exactly their span
    std::fill(b.begin(), b.end(), byte{0xff});
    assert(w.set_data_hash(new_hash()) == OK);
    assert(all_equal(header, 0, DATA_HASH_OFF, 0xff));
    assert(all_equal(header, DATA_HASH_OFF, BLOB_VERSIONED_HASH_OFF, 0));
    assert(all_equal(header, BLOB_VERSIONED_HASH_OFF, BATCH_HEADER_FIXED_LENGTH, 0xff));

    assert(w.set_parent_batch_hash(new_hash()) == OK);
    assert(all_equal(header, PARENT_BATCH_HASH_OFF, BATCH_HEADER_FIXED_LENGTH, 0));
    printf("WORD WINDOWS MATCH LEGACY LAYOUT. \n");
}

void test_enforced_order() {
    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH).unwrap();
    HeaderWriter w(header, FRESH);

    assert(w.set_batch_index(12345) == OK);
    assert(w.set_total_l1_message_popped(500) == OK);

    BatchHeader before = header;
    assert(w.set_l1_message_popped(10) == ORDERING_VIOLATION);
    assert(header == before);
    assert(header.get_total_l1_message_popped() == 500);
    assert(!w.is_written(L1_MESSAGE_POPPED));

    assert(w.set_batch_index(1) == ORDERING_VIOLATION);
    assert(header.get_batch_index() == 12345);

    // same field again is fine while nothing above it is written
    assert(w.set_total_l1_message_popped(501) == OK);
    assert(header.get_total_l1_message_popped() == 501);

    assert(w.set_blob_versioned_hash(pattern_hash(1)) == OK);
    assert(w.set_total_l1_message_popped(502) == ORDERING_VIOLATION);
    assert(header.get_total_l1_message_popped() == 501);

    // version is a lone byte
    assert(w.set_version(BATCH_VERSION_1) == OK);
    assert(header.get_version() == BATCH_VERSION_1);
    printf("OUT OF ORDER WRITES REJECTED. \n");
}

// A loaded header already holds every fixed field.
void test_edit_loaded_header() {
    std::vector<byte> raw = concat_fields(scenario_fields());
    BatchHeader header = BatchHeader::load(raw).unwrap();
    HeaderWriter w(header);
    assert(w.is_complete());

    assert(w.set_batch_index(99) == ORDERING_VIOLATION);
    assert(w.set_l1_message_popped(11) == ORDERING_VIOLATION);
    assert(w.set_total_l1_message_popped(501) == ORDERING_VIOLATION);
    assert(std::equal(raw.begin(), raw.end(), header.data()));
    assert(header.get_l1_message_popped() == 10);
    assert(header.get_total_l1_message_popped() == 500);
    assert(header.get_data_hash() == pattern_hash(0x10));

    // wide fields and version stay editable
    assert(w.set_post_state_hash(pattern_hash(0x01)) == OK);
    assert(header.get_post_state_hash() == pattern_hash(0x01));
    assert(header.get_batch_index() == 12345);
    assert(w.set_version(BATCH_VERSION_1) == OK);

    // same rule for a raw buffer
    HeaderWriter rw{ByteSlice(raw)};
    assert(rw.set_batch_index(99) == ORDERING_VIOLATION);
    assert(raw == concat_fields(scenario_fields()));

    // legacy mode still overwrites
    HeaderWriter lw{ByteSlice(raw), WriterOptions{false}};
    assert(lw.set_batch_index(99) == OK);
    assert(load_l1_message_popped(raw) == 0);
    printf("LOADED HEADER EDITS CHECKED. \n");
}

void test_complete_sequence() {
    BatchHeaderFields f = scenario_fields();
    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH).unwrap();
    HeaderWriter w(header, FRESH);

    assert(!w.is_complete());
    assert(w.set_version(f.version) == OK);
    assert(w.set_batch_index(f.batch_index) == OK);
    assert(w.set_l1_message_popped(f.l1_message_popped) == OK);
    assert(w.set_total_l1_message_popped(f.total_l1_message_popped) == OK);

    // wide fields in any order
    assert(w.set_parent_batch_hash(f.parent_batch_hash) == OK);
    assert(w.set_withdraw_root_hash(f.withdraw_root_hash) == OK);
    assert(w.set_data_hash(f.data_hash) == OK);
    assert(w.set_sequencer_set_verify_hash(f.sequencer_set_verify_hash) == OK);
    assert(w.set_prev_state_hash(f.prev_state_hash) == OK);
    assert(w.set_blob_versioned_hash(f.blob_versioned_hash) == OK);
    assert(!w.is_complete());
    assert(w.set_post_state_hash(f.post_state_hash) == OK);
    assert(w.is_complete());

    assert(header.fields() == f);
    std::vector<byte> expected = concat_fields(f);
    assert(std::equal(expected.begin(), expected.end(), header.data()));
    printf("ORDERED WRITES PRODUCE LAYOUT. \n");
}

void test_trailing_fields() {
    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_V1_LENGTH).unwrap();
    HeaderWriter w(header, FRESH);

    assert(w.set_version(BATCH_VERSION_1) == OK);
    assert(w.set_parent_batch_hash(pattern_hash(9)) == OK);
    assert(w.set_last_block_number(77) == OK);
    assert(w.is_written(LAST_BLOCK_NUMBER));

    uint64_t last_block = 0;
    assert(header.get_last_block_number(&last_block) == OK);
    assert(last_block == 77);
    assert(header.get_parent_batch_hash() == pattern_hash(9));

    BatchHeader v0 = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH + 64).unwrap();
    HeaderWriter w0(v0, FRESH);
    std::vector<byte> words(64, 0x11);
    assert(w0.set_skipped_bitmap(words) == OK);
    assert(std::equal(words.begin(), words.end(), v0.trailing().begin()));
    assert(w0.set_skipped_bitmap(ConstByteSlice(words).first(33)) == MALFORMED_HEADER);

    // lastBlockNumber would land on the bitmap words
    std::vector<byte> before(v0.data(), v0.data() + v0.size());
    assert(w0.set_last_block_number(5) == UNSUPPORTED_VERSION);
    assert(std::equal(before.begin(), before.end(), v0.data()));
    assert(!w0.is_written(LAST_BLOCK_NUMBER));

    assert(w.set_skipped_bitmap(ConstByteSlice()) == UNSUPPORTED_VERSION);
    printf("TRAILING FIELDS WRITTEN. \n");
}

void test_writer_bounds() {
    std::vector<byte> raw(DATA_HASH_OFF - 4, 0xee);
    HeaderWriter w{ByteSlice(raw), FRESH};

    // logical range fits, the word is clipped at the end
    assert(w.set_batch_index(5) == OK);
    assert(load_batch_index(raw) == 5);
    assert(std::all_of(raw.begin() + L1_MSG_POPPED_OFF, raw.end(),
        [](byte x) { return x == 0; }));

    bool thrown = false;
    try {
        w.set_total_l1_message_popped(1);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        w.set_data_hash(pattern_hash(0));
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);

    BatchHeader header = BatchHeader::allocate(BATCH_HEADER_FIXED_LENGTH).unwrap();
    HeaderWriter hw(header, FRESH);
    thrown = false;
    try {
        hw.set_last_block_number(1);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);
    printf("WRITES BOUNDS CHECKED. \n");
}

void main_writer() {
    printf("TESTING WRITER \n");
    test_ordering_hazard();
    test_word_windows();
    test_enforced_order();
    test_edit_loaded_header();
    test_complete_sequence();
    test_trailing_fields();
    test_writer_bounds();
    printf("=====================================\n");
}
