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

#include "batch_store.h"
#include <cstdio>

BatchStore to_batch_store(const BatchHeader &header) {
    return BatchStore{
        header.get_prev_state_hash(),
        header.get_post_state_hash(),
        header.get_withdraw_root_hash(),
        header.get_data_hash(),
        header.get_blob_versioned_hash(),
        header.get_sequencer_set_verify_hash(),
    };
}

void print_batch_store(uint64_t batch_index, const BatchStore &store) {
    printf("batch store of %llu\n", (unsigned long long)batch_index);
    printf("  prevStateRoot:          %s\n", hash_to_hex(store.prev_state_root).c_str());
    printf("  postStateRoot:          %s\n", hash_to_hex(store.post_state_root).c_str());
    printf("  withdrawalRoot:         %s\n", hash_to_hex(store.withdrawal_root).c_str());
    printf("  dataHash:               %s\n", hash_to_hex(store.data_hash).c_str());
    printf("  blobVersionedHash:      %s\n", hash_to_hex(store.blob_versioned_hash).c_str());
    printf("  sequencerSetVerifyHash: %s\n",
        hash_to_hex(store.sequencer_set_verify_hash).c_str());
}
