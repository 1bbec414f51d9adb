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
#include <tuple>
#include "keys.h"
#include "result.h"

using ProofBytes    = std::array<byte, PROOF_BYTES>;
using VkBytes       = std::array<byte, VK_BYTES>;
using PkBytes       = std::array<byte, PK_BYTES>;
using InputBytes    = std::array<byte, INPUT_BYTES>;
using CalldataBytes = std::array<byte, CALLDATA_BYTES>;
using Calldata      = std::tuple<Proof, PublicInput>;

// -------------------- ELEMENTS ---------------------
// Cursor style, each call writes / reads exactly one element width.

void encode_scalar(byte* out, const blst_scalar &s);
void encode_g1(byte* out, const blst_p1 &p);
void encode_g2(byte* out, const blst_p2 &p);

// nullopt when >= r
std::optional<blst_scalar> decode_scalar(const byte* in);
// nullopt on bad flags, off-curve or outside the prime-order subgroup
std::optional<blst_p1> decode_g1(const byte* in);
std::optional<blst_p2> decode_g2(const byte* in);

// -------------------- ARTIFACTS --------------------
// Every decoder takes the buffer length and fails with DECODE_ERR
// unless it is exactly the documented size.

ProofBytes encode_proof(const Proof &proof);
Result<Proof, int> decode_proof(const byte* in, size_t len);

VkBytes encode_verifying_key(const VerifyingKey &vk);
Result<VerifyingKey, int> decode_verifying_key(const byte* in, size_t len);

PkBytes encode_proving_key(const ProvingKey &pk);
Result<ProvingKey, int> decode_proving_key(const byte* in, size_t len);

// DECODE_ERR unless input holds exactly NUM_INPUTS scalars,
// INVALID_SCALAR if one of them is not below r
Result<InputBytes, int> encode_public_input(const PublicInput &input);
Result<PublicInput, int> decode_public_input(const byte* in, size_t len);

Result<CalldataBytes, int> encode_calldata(const Proof &proof, const PublicInput &input);
Result<Calldata, int> decode_calldata(const byte* in, size_t len);
