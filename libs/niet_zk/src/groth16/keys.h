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
#include "circuit.h"

struct ProvingKey {
    blst_p1 alpha_g1;
    blst_p1 beta_g1;
    blst_p2 beta_g2;
    blst_p1 delta_g1;
    blst_p2 delta_g2;

    // [u_i(tau)]_1 per wire
    std::array<blst_p1, NUM_VARIABLES> a_query;
    // [v_i(tau)]_1 and [v_i(tau)]_2 per wire
    std::array<blst_p1, NUM_VARIABLES> b_g1_query;
    std::array<blst_p2, NUM_VARIABLES> b_g2_query;
    // [tau^k * Z(tau) / delta]_1
    std::array<blst_p1, H_SIZE> h_query;
    // [(beta*u_i + alpha*v_i + w_i) / delta]_1, private wires only
    std::array<blst_p1, NUM_PRIVATE> l_query;
};

struct VerifyingKey {
    blst_p1 alpha_g1;
    blst_p2 beta_g2;
    blst_p2 gamma_g2;
    blst_p2 delta_g2;
    // [(beta*u_i + alpha*v_i + w_i) / gamma]_1, public wires only
    std::array<blst_p1, NUM_PUBLIC> ic;
};

struct KeyPair {
    ProvingKey pk;
    VerifyingKey vk;
};

struct Proof {
    blst_p1 a;
    blst_p2 b;
    blst_p1 c;
};

// VerifyingKey with the fixed half of the pairing equation precomputed.
struct PreparedVerifyingKey {
    blst_fp12 alpha_beta_ml;     // miller_loop(beta, alpha)
    blst_p2_affine neg_gamma;
    blst_p2_affine neg_delta;
    std::array<blst_p1, NUM_PUBLIC> ic;
};
