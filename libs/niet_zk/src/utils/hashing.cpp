/*
 * niet_zk
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

#include "hashing.h"
#include <iomanip>
#include <iostream>

Hash derive_hash(const ByteSlice &value) {
    BlakeHasher hasher;
    hasher.update(value.data(), value.size());
    return hasher.finalize();
}

Hash seeded_hash(uint64_t i) {
    BlakeHasher hasher;
    hasher.update_u64(i);
    return hasher.finalize();
}

void print_hash(const Hash &hash) {
    for (byte b : hash) {
        std::cout << std::hex
                  << std::setw(2)
                  << std::setfill('0')
                  << static_cast<unsigned>(b);
    }
    std::cout << std::dec << std::endl; // restore formatting
}
