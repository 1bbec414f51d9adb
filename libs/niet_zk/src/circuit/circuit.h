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

/*  =======================================================
 *  |              R1CS FOR  a * b = c                    |
 *  |=====================================================|
 *  |  wires   z = (1, c, a, b)                           |
 *  |          public:  ONE, c      private:  a, b        |
 *  |-----------------------------------------------------|
 *  |  row 0   a   * b   = c        multiplication        |
 *  |  row 1   ONE * 0   = 0        instance exposure     |
 *  |  row 2   c   * 0   = 0        instance exposure     |
 *  |-----------------------------------------------------|
 *  |  domain  {1, 2, 3}    Z(x) = (x-1)(x-2)(x-3)        |
 *  =======================================================
 */

#pragma once
#include "layout.h"
#include "polynomial.h"

using PublicInput = Scalar_vec;

enum Wire : size_t {
    ONE_WIRE = 0,
    C_WIRE = 1,
    A_WIRE = 2,
    B_WIRE = 3,
};

// coefficient of wire i in row j
using Matrix = std::array<std::array<uint64_t, NUM_VARIABLES>, NUM_CONSTRAINTS>;

constexpr Matrix A_MATRIX = {{
    {0, 0, 1, 0},
    {1, 0, 0, 0},
    {0, 1, 0, 0},
}};
constexpr Matrix B_MATRIX = {{
    {0, 0, 0, 1},
    {0, 0, 0, 0},
    {0, 0, 0, 0},
}};
constexpr Matrix C_MATRIX = {{
    {0, 1, 0, 0},
    {0, 0, 0, 0},
    {0, 0, 0, 0},
}};

// Carries the assignment only. Building one never fails,
// satisfaction is a separate question.
struct Circuit {
    blst_scalar a;
    blst_scalar b;
    blst_scalar c;
};

// u_i(x), v_i(x), w_i(x) per wire and Z(x), all at one point
struct QAPEvals {
    Scalar_vec u;
    Scalar_vec v;
    Scalar_vec w;
    blst_scalar z;
};

Circuit make_circuit(
    const blst_scalar &a,
    const blst_scalar &b,
    const blst_scalar &c
);

Scalar_vec circuit_witness(const Circuit &circuit);
PublicInput circuit_public_input(const Circuit &circuit);
bool is_satisfied(const Circuit &circuit);

const Scalar_vec& evaluation_domain();
bool in_domain(const blst_scalar &x);

// nullopt when tau is a domain point
std::optional<QAPEvals> qap_at(const blst_scalar &tau);

// h(x) = (A(x)B(x) - C(x)) / Z(x), nullopt on non-zero remainder
std::optional<Polynomial> compute_h(const Scalar_vec &witness);
