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
 *  |                 WIRE FORMAT (v1)                    |
 *  |=====================================================|
 *  |  Fr     32   little-endian, < r                     |
 *  |  G1     48   compressed, big-endian x + flag bits   |
 *  |  G2     96   compressed, big-endian x + flag bits   |
 *  |-----------------------------------------------------|
 *  |  Proof        A | B | C                       192   |
 *  |  PublicInput  c                                32   |
 *  |  Calldata     Proof | PublicInput             224   |
 *  |  VK           alpha | beta | gamma | delta    432   |
 *  |               | ic[0] | ic[1]                       |
 *  |  PK           alpha_g1 | beta_g1 | beta_g2          |
 *  |               | delta_g1 | delta_g2 | a[4]          |
 *  |               | b_g1[4] | b_g2[4] | h[2] | l[2]     |
 *  |                                              1296   |
 *  =======================================================
 *
 *  Changing anything here invalidates every key, proof and
 *  calldata blob ever written. No curve library in this header,
 *  the sandbox includes it.
 */

#pragma once
#include <cstddef>

// circuit shape
constexpr size_t NUM_VARIABLES   = 4;   // ONE, c, a, b
constexpr size_t NUM_PUBLIC      = 2;   // ONE, c
constexpr size_t NUM_PRIVATE     = NUM_VARIABLES - NUM_PUBLIC;
constexpr size_t NUM_INPUTS      = NUM_PUBLIC - 1;
constexpr size_t NUM_CONSTRAINTS = 3;
constexpr size_t H_SIZE          = NUM_CONSTRAINTS - 1;

// element widths
constexpr size_t FR_BYTES = 32;
constexpr size_t G1_BYTES = 48;
constexpr size_t G2_BYTES = 96;

// proof
constexpr size_t PROOF_A_OFFSET = 0;
constexpr size_t PROOF_B_OFFSET = PROOF_A_OFFSET + G1_BYTES;
constexpr size_t PROOF_C_OFFSET = PROOF_B_OFFSET + G2_BYTES;
constexpr size_t PROOF_BYTES    = PROOF_C_OFFSET + G1_BYTES;

constexpr size_t INPUT_BYTES    = NUM_INPUTS * FR_BYTES;
constexpr size_t CALLDATA_BYTES = PROOF_BYTES + INPUT_BYTES;

// verifying key
constexpr size_t VK_ALPHA_OFFSET = 0;
constexpr size_t VK_BETA_OFFSET  = VK_ALPHA_OFFSET + G1_BYTES;
constexpr size_t VK_GAMMA_OFFSET = VK_BETA_OFFSET + G2_BYTES;
constexpr size_t VK_DELTA_OFFSET = VK_GAMMA_OFFSET + G2_BYTES;
constexpr size_t VK_IC_OFFSET    = VK_DELTA_OFFSET + G2_BYTES;
constexpr size_t VK_BYTES        = VK_IC_OFFSET + NUM_PUBLIC * G1_BYTES;

// proving key
constexpr size_t PK_BYTES =
    3 * G1_BYTES + 2 * G2_BYTES     // alpha_g1 beta_g1 delta_g1 beta_g2 delta_g2
    + NUM_VARIABLES * G1_BYTES      // a_query
    + NUM_VARIABLES * G1_BYTES      // b_g1_query
    + NUM_VARIABLES * G2_BYTES      // b_g2_query
    + H_SIZE * G1_BYTES             // h_query
    + NUM_PRIVATE * G1_BYTES;       // l_query

static_assert(PROOF_BYTES == 192);
static_assert(CALLDATA_BYTES == 224);
static_assert(VK_BYTES == 432);
static_assert(PK_BYTES == 1296);
