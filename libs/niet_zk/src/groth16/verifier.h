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
#include "keys.h"

PreparedVerifyingKey prepare_verifying_key(const VerifyingKey &vk);

// e(A, B) == e(alpha, beta) * e(L, gamma) * e(C, delta)
// with L = ic[0] + sum input_i * ic[i + 1].
// False on a wrong input count or a non-canonical input.
bool verify_proof(
    const PreparedVerifyingKey &pvk,
    const Proof &proof,
    const PublicInput &inputs
);
bool verify_proof(
    const VerifyingKey &vk,
    const Proof &proof,
    const PublicInput &inputs
);

// OK, DECODE_ERR on malformed bytes, VERIFICATION_FAILED otherwise.
int verify_encoded(
    const byte* vk, size_t vk_len,
    const byte* proof, size_t proof_len,
    const byte* input, size_t input_len
);
int verify_calldata(
    const VerifyingKey &vk,
    const byte* calldata,
    size_t len
);
