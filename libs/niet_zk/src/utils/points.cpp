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
// =============== POINTS ================
// =======================================


// -------------------- P1 ---------------------------

blst_p1 new_inf_p1() {
    blst_p1 p;
    blst_p1_mult(&p, blst_p1_generator(), ZERO_SK.b, SCALAR_BITS);
    return p;
}

blst_p1_affine p1_to_affine(const blst_p1 &p1) {
    blst_p1_affine aff;
    blst_p1_to_affine(&aff, &p1);
    return aff;
}

blst_p1 p1_from_affine(const blst_p1_affine &aff) {
    blst_p1 p1;
    blst_p1_from_affine(&p1, &aff);
    return p1;
}

void p1_mult(blst_p1 &dst, const blst_p1 &a, const blst_scalar &b) {
    blst_p1_mult(&dst, &a, b.b, SCALAR_BITS);
}

void p1_add_inplace(blst_p1 &dst, const blst_p1 &src) {
    blst_p1_add_or_double(&dst, &dst, &src);
}

blst_p1 g1_mul(const blst_scalar &s) {
    blst_p1 p;
    blst_p1_mult(&p, blst_p1_generator(), s.b, SCALAR_BITS);
    return p;
}

bool p1_equal(const blst_p1 &a, const blst_p1 &b) {
    return blst_p1_is_equal(&a, &b);
}

std::array<byte, 48> compress_p1(const blst_p1 &p) {
    std::array<byte, 48> comp;
    blst_p1_compress(comp.data(), &p);
    return comp;
}

void print_p1(const blst_p1 &p) {
    auto comp = compress_p1(p);
    for (auto b : comp)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    std::cout << std::dec << std::endl;
}

// -------------------- P2 ---------------------------

blst_p2_affine p2_to_affine(const blst_p2 &p2) {
    blst_p2_affine aff;
    blst_p2_to_affine(&aff, &p2);
    return aff;
}

blst_p2 p2_from_affine(const blst_p2_affine &aff) {
    blst_p2 p2;
    blst_p2_from_affine(&p2, &aff);
    return p2;
}

void p2_mult(blst_p2 &dst, const blst_p2 &a, const blst_scalar &b) {
    blst_p2_mult(&dst, &a, b.b, SCALAR_BITS);
}

void p2_add_inplace(blst_p2 &dst, const blst_p2 &src) {
    blst_p2_add_or_double(&dst, &dst, &src);
}

blst_p2 g2_mul(const blst_scalar &s) {
    blst_p2 p;
    blst_p2_mult(&p, blst_p2_generator(), s.b, SCALAR_BITS);
    return p;
}

bool p2_equal(const blst_p2 &a, const blst_p2 &b) {
    return blst_p2_is_equal(&a, &b);
}

std::array<byte, 96> compress_p2(const blst_p2 &p) {
    std::array<byte, 96> comp;
    blst_p2_compress(comp.data(), &p);
    return comp;
}

void print_p2(const blst_p2 &p) {
    auto comp = compress_p2(p);
    for (auto b : comp)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b;
    std::cout << std::dec << std::endl;
}

// -------------------- PAIRING ----------------------

void miller_loop_or_one(
    blst_fp12 &out,
    const blst_p2_affine &Q,
    const blst_p1_affine &P
) {
    // e(0, Q) == e(P, 0) == 1
    if (blst_p1_affine_is_inf(&P) || blst_p2_affine_is_inf(&Q)) {
        out = *blst_fp12_one();
        return;
    }
    blst_miller_loop(&out, &Q, &P);
}
