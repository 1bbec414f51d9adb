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


/*  Host import surface of the sandboxed verifier.
 *
 *  Buffers use the wire encodings of layout.h: compressed G1 (48),
 *  compressed G2 (96), little-endian Fr (32). Every import returns
 *  OK (0) on success; DECODE_ERR when an input buffer does not decode
 *  to a subgroup point or a canonical scalar; HOST_FAULT (or any other
 *  non-zero code) when the call itself is broken, e.g. a null buffer.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include "layout.h"

constexpr size_t PAIR_BYTES = G1_BYTES + G2_BYTES;

extern "C" {
    int32_t zk_host_g1_add(
        const uint8_t p[G1_BYTES],
        const uint8_t q[G1_BYTES],
        uint8_t out[G1_BYTES]
    );

    int32_t zk_host_g1_mul(
        const uint8_t p[G1_BYTES],
        const uint8_t k[FR_BYTES],
        uint8_t out[G1_BYTES]
    );

    // *ok = 1 when prod e(G1_i, G2_i) is the identity of GT, else 0.
    // pairs holds n consecutive G1 || G2 entries.
    int32_t zk_host_pairing_check(
        const uint8_t* pairs,
        size_t n,
        uint8_t* ok
    );
}

using HostG1Add = int32_t (*)(const uint8_t*, const uint8_t*, uint8_t*);
using HostG1Mul = int32_t (*)(const uint8_t*, const uint8_t*, uint8_t*);
using HostPairingCheck = int32_t (*)(const uint8_t*, size_t, uint8_t*);

// Import table the verifier core runs against. The contract binds it
// to the link-time symbols above, tests bind it to wrappers.
struct ZkHostImports {
    HostG1Add g1_add;
    HostG1Mul g1_mul;
    HostPairingCheck pairing_check;
};
