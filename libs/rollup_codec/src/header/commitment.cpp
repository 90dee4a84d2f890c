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

#include "commitment.h"
#include "layout.h"

Result<Hash, int> compute_batch_hash(const ConstByteSlice &buff, size_t length) {
    check_range(buff.size(), 0, length);
    if (length < BATCH_HEADER_FIXED_LENGTH) return MALFORMED_HEADER;

    return derive_hash(buff.first(length));
}
