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

#pragma once
#include "blake3.h"
#include "blst.h"
#include <array>
#include <cstdint>
#include <span>
#include <string>

using Hash = std::array<byte, 32>;
using ByteSlice = std::span<const byte>;

class BlakeHasher {
private: blake3_hasher h_;
public:
    BlakeHasher() { blake3_hasher_init(&h_); }
    ~BlakeHasher() = default;

    void update(const byte* data, const size_t size) {
        blake3_hasher_update(&h_, data, size);
    }
    void update(const std::string &tag) {
        blake3_hasher_update(&h_, tag.data(), tag.size());
    }
    void update_u64(uint64_t v) {
        byte le[8];
        for (size_t i = 0; i < 8; i++) le[i] = static_cast<byte>(v >> (8 * i));
        blake3_hasher_update(&h_, le, 8);
    }
    Hash finalize() {
        Hash out;
        blake3_hasher_finalize(&h_, out.data(), out.size());
        return out;
    }
    // extendable output
    void finalize(byte* out, size_t len) {
        blake3_hasher_finalize(&h_, out, len);
    }
};

Hash derive_hash(const ByteSlice &value);
Hash seeded_hash(uint64_t i);
void print_hash(const Hash &hash);
