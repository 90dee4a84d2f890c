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
#include "utils.h"

//   Field                   Bytes   Type        Offset
//   version                 1       uint8       0
//   batchIndex              8       uint64      1
//   l1MessagePopped         8       uint64      9
//   totalL1MessagePopped    8       uint64      17
//   dataHash                32      bytes32     25
//   blobVersionedHash       32      bytes32     57
//   prevStateHash           32      bytes32     89
//   postStateHash           32      bytes32     121
//   withdrawRootHash        32      bytes32     153
//   sequencerSetVerifyHash  32      bytes32     185
//   parentBatchHash         32      bytes32     217
//   ---- v0: skippedL1MessageBitmap   dynamic uint256[]  249
//   ---- v1: lastBlockNumber          8       uint64     249

const size_t HASH_SIZE = 32;
const size_t U64_SIZE = sizeof(uint64_t);

// legacy stores always write a full word
const size_t WORD_SIZE = 32;

const size_t VERSION_OFF = 0;
const size_t BATCH_INDEX_OFF = VERSION_OFF + 1;
const size_t L1_MSG_POPPED_OFF = BATCH_INDEX_OFF + U64_SIZE;
const size_t TOTAL_L1_MSG_POPPED_OFF = L1_MSG_POPPED_OFF + U64_SIZE;
const size_t DATA_HASH_OFF = TOTAL_L1_MSG_POPPED_OFF + U64_SIZE;
const size_t BLOB_VERSIONED_HASH_OFF = DATA_HASH_OFF + HASH_SIZE;
const size_t PREV_STATE_HASH_OFF = BLOB_VERSIONED_HASH_OFF + HASH_SIZE;
const size_t POST_STATE_HASH_OFF = PREV_STATE_HASH_OFF + HASH_SIZE;
const size_t WITHDRAW_ROOT_HASH_OFF = POST_STATE_HASH_OFF + HASH_SIZE;
const size_t SEQUENCER_SET_VERIFY_HASH_OFF = WITHDRAW_ROOT_HASH_OFF + HASH_SIZE;
const size_t PARENT_BATCH_HASH_OFF = SEQUENCER_SET_VERIFY_HASH_OFF + HASH_SIZE;

const size_t BATCH_HEADER_FIXED_LENGTH = PARENT_BATCH_HASH_OFF + HASH_SIZE;

const size_t SKIPPED_BITMAP_OFF = BATCH_HEADER_FIXED_LENGTH;
const size_t SKIPPED_BITMAP_WORD_SIZE = 32;

const size_t LAST_BLOCK_NUMBER_OFF = BATCH_HEADER_FIXED_LENGTH;
const size_t BATCH_HEADER_V1_LENGTH = LAST_BLOCK_NUMBER_OFF + U64_SIZE;

constexpr uint8_t BATCH_VERSION_0 = 0;
constexpr uint8_t BATCH_VERSION_1 = 1;

static_assert(BATCH_HEADER_FIXED_LENGTH == 249);
static_assert(BATCH_HEADER_V1_LENGTH == 257);

// Values are stable, they cross the C ABI as field selectors.
enum HeaderField {
    VERSION = 0,
    BATCH_INDEX = 1,
    L1_MESSAGE_POPPED = 2,
    TOTAL_L1_MESSAGE_POPPED = 3,
    DATA_HASH = 4,
    BLOB_VERSIONED_HASH = 5,
    PREV_STATE_HASH = 6,
    POST_STATE_HASH = 7,
    WITHDRAW_ROOT_HASH = 8,
    SEQUENCER_SET_VERIFY_HASH = 9,
    PARENT_BATCH_HASH = 10,
    LAST_BLOCK_NUMBER = 11,
};

const size_t FIXED_FIELD_COUNT = 11;

struct FieldSpan {
    size_t offset;
    size_t width;
};

// Logical extent of each field, indexed by HeaderField.
constexpr FieldSpan FIELD_SPANS[] = {
    {VERSION_OFF, 1},
    {BATCH_INDEX_OFF, U64_SIZE},
    {L1_MSG_POPPED_OFF, U64_SIZE},
    {TOTAL_L1_MSG_POPPED_OFF, U64_SIZE},
    {DATA_HASH_OFF, HASH_SIZE},
    {BLOB_VERSIONED_HASH_OFF, HASH_SIZE},
    {PREV_STATE_HASH_OFF, HASH_SIZE},
    {POST_STATE_HASH_OFF, HASH_SIZE},
    {WITHDRAW_ROOT_HASH_OFF, HASH_SIZE},
    {SEQUENCER_SET_VERIFY_HASH_OFF, HASH_SIZE},
    {PARENT_BATCH_HASH_OFF, HASH_SIZE},
    {LAST_BLOCK_NUMBER_OFF, U64_SIZE},
};

inline bool is_hash_field(int field) {
    return field >= DATA_HASH && field <= PARENT_BATCH_HASH;
}

inline bool is_scalar_field(int field) {
    return (field >= VERSION && field <= TOTAL_L1_MESSAGE_POPPED)
        || field == LAST_BLOCK_NUMBER;
}

enum CodecCodes {
    OK = 0,
    MALFORMED_HEADER = 1,
    ORDERING_VIOLATION = 2,
    UNSUPPORTED_VERSION = 3,
    NULL_PARAMETER = 4,
    INVALID_FIELD = 5,
};
