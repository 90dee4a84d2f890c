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
#include "hashing.h"
#include "result.h"

// keccak256 over buff[0, length). length is explicit so callers decide
// whether trailing data takes part. Fails with MALFORMED_HEADER below the
// fixed header length and throws std::out_of_range past the buffer end.
Result<Hash, int> compute_batch_hash(const ConstByteSlice &buff, size_t length);
