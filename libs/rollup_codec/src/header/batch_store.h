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
#include "batch_header.h"

// State commitments of a batch, as re-submitted by the verification side.
struct BatchStore {
    Hash prev_state_root;
    Hash post_state_root;
    Hash withdrawal_root;
    Hash data_hash;
    Hash blob_versioned_hash;
    Hash sequencer_set_verify_hash;

    bool operator==(const BatchStore& other) const = default;
};

BatchStore to_batch_store(const BatchHeader &header);

void print_batch_store(uint64_t batch_index, const BatchStore &store);
