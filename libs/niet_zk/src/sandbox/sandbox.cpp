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


#include <cstring>
#include "codes.h"
#include "sandbox.h"

// r, little-endian
static const uint8_t FIELD_ORDER[FR_BYTES] = {
    0x01, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff,
    0xfe, 0x5b, 0xfe, 0xff, 0x02, 0xa4, 0xbd, 0x53,
    0x05, 0xd8, 0xa1, 0x09, 0x08, 0xd8, 0x39, 0x33,
    0x48, 0x7d, 0x9d, 0x29, 0x53, 0xa7, 0xed, 0x73,
};

// r - 1, scalar for negation
static const uint8_t FIELD_ORDER_MINUS_ONE[FR_BYTES] = {
    0x00, 0x00, 0x00, 0x00, 0xff, 0xff, 0xff, 0xff,
    0xfe, 0x5b, 0xfe, 0xff, 0x02, 0xa4, 0xbd, 0x53,
    0x05, 0xd8, 0xa1, 0x09, 0x08, 0xd8, 0x39, 0x33,
    0x48, 0x7d, 0x9d, 0x29, 0x53, 0xa7, 0xed, 0x73,
};

constexpr size_t NUM_PAIRS = 4;

bool below_field_order(const uint8_t s[FR_BYTES]) {
    for (size_t i = FR_BYTES; i-- > 0;) {
        if (s[i] < FIELD_ORDER[i]) return true;
        if (s[i] > FIELD_ORDER[i]) return false;
    }
    return false;
}

static uint32_t map_host_rc(int32_t rc) {
    return rc == DECODE_ERR ? SANDBOX_INVALID : SANDBOX_FAULT;
}

static void put_pair(uint8_t* pairs, size_t idx, const uint8_t* g1, const uint8_t* g2) {
    uint8_t* dst = pairs + idx * PAIR_BYTES;
    std::memcpy(dst, g1, G1_BYTES);
    std::memcpy(dst + G1_BYTES, g2, G2_BYTES);
}

uint32_t sandbox_verify(
    const ZkHostImports &host,
    const uint8_t* vk, size_t vk_len,
    const uint8_t* calldata, size_t len
) {
    if (!host.g1_add || !host.g1_mul || !host.pairing_check) return SANDBOX_FAULT;
    if (!vk || vk_len != VK_BYTES) return SANDBOX_FAULT;
    if (!calldata || len != CALLDATA_BYTES) return SANDBOX_INVALID;

    const uint8_t* A = calldata + PROOF_A_OFFSET;
    const uint8_t* B = calldata + PROOF_B_OFFSET;
    const uint8_t* C = calldata + PROOF_C_OFFSET;
    const uint8_t* input = calldata + PROOF_BYTES;

    if (!below_field_order(input)) return SANDBOX_INVALID;

    const uint8_t* ic0 = vk + VK_IC_OFFSET;
    const uint8_t* ic1 = ic0 + G1_BYTES;

    // L = ic[0] + c * ic[1]
    uint8_t term[G1_BYTES];
    uint8_t L[G1_BYTES];
    int32_t rc = host.g1_mul(ic1, input, term);
    if (rc != OK) return map_host_rc(rc);
    rc = host.g1_add(ic0, term, L);
    if (rc != OK) return map_host_rc(rc);

    uint8_t neg_A[G1_BYTES];
    rc = host.g1_mul(A, FIELD_ORDER_MINUS_ONE, neg_A);
    if (rc != OK) return map_host_rc(rc);

    // e(-A, B) * e(alpha, beta) * e(L, gamma) * e(C, delta) == 1
    uint8_t pairs[NUM_PAIRS * PAIR_BYTES];
    put_pair(pairs, 0, neg_A, B);
    put_pair(pairs, 1, vk + VK_ALPHA_OFFSET, vk + VK_BETA_OFFSET);
    put_pair(pairs, 2, L, vk + VK_GAMMA_OFFSET);
    put_pair(pairs, 3, C, vk + VK_DELTA_OFFSET);

    uint8_t ok = 0;
    rc = host.pairing_check(pairs, NUM_PAIRS, &ok);
    if (rc != OK) return map_host_rc(rc);

    return ok == 1 ? SANDBOX_VALID : SANDBOX_INVALID;
}
