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

#include <iomanip>
#include <iostream>
#include "utils.h"


// =======================================
// =============== SCALAR ================
// =======================================

blst_scalar new_scalar(const uint64_t v) {
    blst_scalar s;
    uint64_t limbs[4] = {v, 0, 0, 0};
    blst_scalar_from_uint64(&s, limbs);
    return s;
}

bool scalar_is_zero(const blst_scalar &s) {
    for (size_t i = 0; i < 32; i++) {
        if (s.b[i] != 0) return false;
    }
    return true;
}

// strictly below the group order r
bool scalar_is_canonical(const blst_scalar &s) {
    return blst_scalar_fr_check(&s);
}

bool equal_scalars(const blst_scalar &a, const blst_scalar &b) {
    return std::memcmp(a.b, b.b, 32) == 0;
}

blst_scalar scalar_mul(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_mul_n_check(&res, &a, &b);
    return res;
}

blst_scalar scalar_add(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_add_n_check(&res, &a, &b);
    return res;
}

blst_scalar scalar_sub(const blst_scalar &a, const blst_scalar &b) {
    blst_scalar res;
    blst_sk_sub_n_check(&res, &a, &b);
    return res;
}

void scalar_add_inplace(blst_scalar &dst, const blst_scalar &src) {
    blst_sk_add_n_check(&dst, &dst, &src);
}
void scalar_sub_inplace(blst_scalar &dst, const blst_scalar &src) {
    blst_sk_sub_n_check(&dst, &dst, &src);
}
void scalar_mul_inplace(blst_scalar &dst, const blst_scalar &mult) {
    blst_sk_mul_n_check(&dst, &dst, &mult);
}

void scalar_pow(blst_scalar &out, const blst_scalar &base, uint64_t exp) {
    blst_scalar tmp = base;
    blst_scalar result = ONE_SK;

    while (exp > 0) {
        if (exp & 1) {
            blst_sk_mul_n_check(&result, &result, &tmp);
        }
        blst_sk_mul_n_check(&tmp, &tmp, &tmp);
        exp >>= 1;
    }
    out = result;
}

blst_scalar neg_scalar(const blst_scalar &sk) {
    blst_scalar zero = ZERO_SK;
    scalar_sub_inplace(zero, sk);
    return zero;
}

blst_scalar inv_scalar(const blst_scalar &a) {
    blst_scalar res;
    blst_sk_inverse(&res, &a);
    return res;
}

// Montgomery's trick, one inversion for the whole vector.
// false if any input is zero.
bool batch_inv(Scalar_vec &out, const Scalar_vec &in) {
    out.resize(in.size());
    blst_scalar accumulator = ONE_SK;
    for (size_t i{}; i < in.size(); i++) {
        out[i] = accumulator;
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }

    if (scalar_is_zero(accumulator)) return false;

    blst_sk_inverse(&accumulator, &accumulator);

    for (size_t i = in.size(); i-- > 0;) {
        blst_sk_mul_n_check(&out[i], &out[i], &accumulator);
        blst_sk_mul_n_check(&accumulator, &accumulator, &in[i]);
    }

    return true;
}

void wipe_scalar(blst_scalar &s) {
    volatile byte* p = s.b;
    for (size_t i = 0; i < sizeof(s.b); i++) p[i] = 0;
}

void wipe_scalars(Scalar_vec &v) {
    for (auto &s: v) wipe_scalar(s);
}

void print_scalar(const blst_scalar &s) {
    // most significant byte first
    for (size_t i = 32; i-- > 0;)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)s.b[i];
    std::cout << std::dec << std::endl;
}
