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
#include "blst.h"
#include <array>
#include <cstdint>
#include <cstring>
#include <vector>

using Scalar_vec = std::vector<blst_scalar>;
using Polynomial = std::vector<blst_scalar>;

const size_t SCALAR_BITS = 256;


// =======================================
// =============== POINTS ================
// =======================================

blst_p1 new_inf_p1();
blst_p1_affine p1_to_affine(const blst_p1 &p1);
blst_p1 p1_from_affine(const blst_p1_affine &aff);
void p1_mult(blst_p1 &dst, const blst_p1 &a, const blst_scalar &b);
void p1_add_inplace(blst_p1 &dst, const blst_p1 &src);
blst_p1 g1_mul(const blst_scalar &s);
bool p1_equal(const blst_p1 &a, const blst_p1 &b);

std::array<byte, 48> compress_p1(const blst_p1 &p);
void print_p1(const blst_p1 &p);

blst_p2_affine p2_to_affine(const blst_p2 &p2);
blst_p2 p2_from_affine(const blst_p2_affine &aff);
void p2_mult(blst_p2 &dst, const blst_p2 &a, const blst_scalar &b);
void p2_add_inplace(blst_p2 &dst, const blst_p2 &src);
blst_p2 g2_mul(const blst_scalar &s);
bool p2_equal(const blst_p2 &a, const blst_p2 &b);

std::array<byte, 96> compress_p2(const blst_p2 &p);
void print_p2(const blst_p2 &p);

// Miller loop of (Q, P); the identity when either side is at infinity.
void miller_loop_or_one(
    blst_fp12 &out,
    const blst_p2_affine &Q,
    const blst_p1_affine &P
);


// =======================================
// =============== SCALARS ===============
// =======================================

blst_scalar new_scalar(const uint64_t v = 0);
bool scalar_is_zero(const blst_scalar &s);
bool scalar_is_canonical(const blst_scalar &s);
bool equal_scalars(const blst_scalar &a, const blst_scalar &b);
void print_scalar(const blst_scalar &s);

blst_scalar scalar_mul(const blst_scalar &a, const blst_scalar &b);
blst_scalar scalar_add(const blst_scalar &a, const blst_scalar &b);
blst_scalar scalar_sub(const blst_scalar &a, const blst_scalar &b);
void scalar_add_inplace(blst_scalar &dst, const blst_scalar &src);
void scalar_sub_inplace(blst_scalar &dst, const blst_scalar &src);
void scalar_mul_inplace(blst_scalar &dst, const blst_scalar &mult);
void scalar_pow(blst_scalar &out, const blst_scalar &base, uint64_t exp);

blst_scalar neg_scalar(const blst_scalar &sk);
blst_scalar inv_scalar(const blst_scalar &a);
bool batch_inv(Scalar_vec &out, const Scalar_vec &in);

void wipe_scalar(blst_scalar &s);
void wipe_scalars(Scalar_vec &v);

inline const blst_scalar ZERO_SK = new_scalar(0);
inline const blst_scalar ONE_SK = new_scalar(1);
