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


#include "codes.h"
#include "native_host.h"
#include "serialize.h"


extern "C" int32_t zk_host_g1_add(
    const uint8_t p[G1_BYTES],
    const uint8_t q[G1_BYTES],
    uint8_t out[G1_BYTES]
) {
    if (!p || !q || !out) return HOST_FAULT;

    auto P = decode_g1(p);
    auto Q = decode_g1(q);
    if (!P || !Q) return DECODE_ERR;

    p1_add_inplace(*P, *Q);
    encode_g1(out, *P);
    return OK;
}

extern "C" int32_t zk_host_g1_mul(
    const uint8_t p[G1_BYTES],
    const uint8_t k[FR_BYTES],
    uint8_t out[G1_BYTES]
) {
    if (!p || !k || !out) return HOST_FAULT;

    auto P = decode_g1(p);
    auto K = decode_scalar(k);
    if (!P || !K) return DECODE_ERR;

    blst_p1 R;
    p1_mult(R, *P, *K);
    encode_g1(out, R);
    return OK;
}

extern "C" int32_t zk_host_pairing_check(
    const uint8_t* pairs,
    size_t n,
    uint8_t* ok
) {
    if (!ok || (n > 0 && !pairs)) return HOST_FAULT;
    *ok = 0;

    blst_fp12 acc = *blst_fp12_one();
    blst_fp12 ml;
    for (size_t i{}; i < n; i++) {
        const uint8_t* pair = pairs + i * PAIR_BYTES;
        auto P = decode_g1(pair);
        auto Q = decode_g2(pair + G1_BYTES);
        if (!P || !Q) return DECODE_ERR;

        miller_loop_or_one(ml, p2_to_affine(*Q), p1_to_affine(*P));
        blst_fp12_mul(&acc, &acc, &ml);
    }

    blst_fp12 gt;
    blst_final_exp(&gt, &acc);
    *ok = blst_fp12_is_one(&gt) ? 1 : 0;
    return OK;
}

const ZkHostImports& native_host_imports() {
    static const ZkHostImports imports = {
        zk_host_g1_add,
        zk_host_g1_mul,
        zk_host_pairing_check,
    };
    return imports;
}
