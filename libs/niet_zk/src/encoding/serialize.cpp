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
#include "serialize.h"


// -------------------- ELEMENTS ---------------------

void encode_scalar(byte* out, const blst_scalar &s) {
    // blst_scalar already holds little-endian bytes
    std::memcpy(out, s.b, FR_BYTES);
}

void encode_g1(byte* out, const blst_p1 &p) {
    blst_p1_compress(out, &p);
}

void encode_g2(byte* out, const blst_p2 &p) {
    blst_p2_compress(out, &p);
}

std::optional<blst_scalar> decode_scalar(const byte* in) {
    blst_scalar s;
    std::memcpy(s.b, in, FR_BYTES);
    if (!scalar_is_canonical(s)) return std::nullopt;
    return s;
}

std::optional<blst_p1> decode_g1(const byte* in) {
    blst_p1_affine aff;
    if (blst_p1_uncompress(&aff, in) != BLST_SUCCESS) return std::nullopt;
    if (!blst_p1_affine_in_g1(&aff)) return std::nullopt;
    return p1_from_affine(aff);
}

std::optional<blst_p2> decode_g2(const byte* in) {
    blst_p2_affine aff;
    if (blst_p2_uncompress(&aff, in) != BLST_SUCCESS) return std::nullopt;
    if (!blst_p2_affine_in_g2(&aff)) return std::nullopt;
    return p2_from_affine(aff);
}

template <size_t N>
static void encode_g1_array(byte* &cursor, const std::array<blst_p1, N> &ps) {
    for (auto &p: ps) {
        encode_g1(cursor, p); cursor += G1_BYTES;
    }
}

template <size_t N>
static void encode_g2_array(byte* &cursor, const std::array<blst_p2, N> &ps) {
    for (auto &p: ps) {
        encode_g2(cursor, p); cursor += G2_BYTES;
    }
}

static bool read_g1(const byte* &cursor, blst_p1 &out) {
    auto p = decode_g1(cursor);
    if (!p.has_value()) return false;
    out = *p; cursor += G1_BYTES;
    return true;
}

static bool read_g2(const byte* &cursor, blst_p2 &out) {
    auto p = decode_g2(cursor);
    if (!p.has_value()) return false;
    out = *p; cursor += G2_BYTES;
    return true;
}

template <size_t N>
static bool read_g1_array(const byte* &cursor, std::array<blst_p1, N> &out) {
    for (auto &p: out) if (!read_g1(cursor, p)) return false;
    return true;
}

template <size_t N>
static bool read_g2_array(const byte* &cursor, std::array<blst_p2, N> &out) {
    for (auto &p: out) if (!read_g2(cursor, p)) return false;
    return true;
}


// -------------------- PROOF ------------------------

ProofBytes encode_proof(const Proof &proof) {
    ProofBytes out;
    encode_g1(out.data() + PROOF_A_OFFSET, proof.a);
    encode_g2(out.data() + PROOF_B_OFFSET, proof.b);
    encode_g1(out.data() + PROOF_C_OFFSET, proof.c);
    return out;
}

Result<Proof, int> decode_proof(const byte* in, size_t len) {
    if (!in || len != PROOF_BYTES) return fail(DECODE_ERR);

    Proof proof;
    const byte* cursor = in;
    if (!read_g1(cursor, proof.a)) return fail(DECODE_ERR);
    if (!read_g2(cursor, proof.b)) return fail(DECODE_ERR);
    if (!read_g1(cursor, proof.c)) return fail(DECODE_ERR);
    return proof;
}


// -------------------- VERIFYING KEY ----------------

VkBytes encode_verifying_key(const VerifyingKey &vk) {
    VkBytes out;
    byte* cursor = out.data();
    encode_g1(cursor, vk.alpha_g1); cursor += G1_BYTES;
    encode_g2(cursor, vk.beta_g2);  cursor += G2_BYTES;
    encode_g2(cursor, vk.gamma_g2); cursor += G2_BYTES;
    encode_g2(cursor, vk.delta_g2); cursor += G2_BYTES;
    encode_g1_array(cursor, vk.ic);
    return out;
}

Result<VerifyingKey, int> decode_verifying_key(const byte* in, size_t len) {
    if (!in || len != VK_BYTES) return fail(DECODE_ERR);

    VerifyingKey vk;
    const byte* cursor = in;
    if (!read_g1(cursor, vk.alpha_g1)
        || !read_g2(cursor, vk.beta_g2)
        || !read_g2(cursor, vk.gamma_g2)
        || !read_g2(cursor, vk.delta_g2)
        || !read_g1_array(cursor, vk.ic)
    ) return fail(DECODE_ERR);
    return vk;
}


// -------------------- PROVING KEY ------------------

PkBytes encode_proving_key(const ProvingKey &pk) {
    PkBytes out;
    byte* cursor = out.data();
    encode_g1(cursor, pk.alpha_g1); cursor += G1_BYTES;
    encode_g1(cursor, pk.beta_g1);  cursor += G1_BYTES;
    encode_g2(cursor, pk.beta_g2);  cursor += G2_BYTES;
    encode_g1(cursor, pk.delta_g1); cursor += G1_BYTES;
    encode_g2(cursor, pk.delta_g2); cursor += G2_BYTES;
    encode_g1_array(cursor, pk.a_query);
    encode_g1_array(cursor, pk.b_g1_query);
    encode_g2_array(cursor, pk.b_g2_query);
    encode_g1_array(cursor, pk.h_query);
    encode_g1_array(cursor, pk.l_query);
    return out;
}

Result<ProvingKey, int> decode_proving_key(const byte* in, size_t len) {
    if (!in || len != PK_BYTES) return fail(DECODE_ERR);

    ProvingKey pk;
    const byte* cursor = in;
    if (!read_g1(cursor, pk.alpha_g1)
        || !read_g1(cursor, pk.beta_g1)
        || !read_g2(cursor, pk.beta_g2)
        || !read_g1(cursor, pk.delta_g1)
        || !read_g2(cursor, pk.delta_g2)
        || !read_g1_array(cursor, pk.a_query)
        || !read_g1_array(cursor, pk.b_g1_query)
        || !read_g2_array(cursor, pk.b_g2_query)
        || !read_g1_array(cursor, pk.h_query)
        || !read_g1_array(cursor, pk.l_query)
    ) return fail(DECODE_ERR);
    return pk;
}


// -------------------- PUBLIC INPUT -----------------

Result<InputBytes, int> encode_public_input(const PublicInput &input) {
    if (input.size() != NUM_INPUTS) return fail(DECODE_ERR);

    InputBytes out{};
    byte* cursor = out.data();
    for (auto &s: input) {
        if (!scalar_is_canonical(s)) return fail(INVALID_SCALAR);
        encode_scalar(cursor, s); cursor += FR_BYTES;
    }
    return out;
}

Result<PublicInput, int> decode_public_input(const byte* in, size_t len) {
    if (!in || len != INPUT_BYTES) return fail(DECODE_ERR);

    PublicInput input(NUM_INPUTS);
    const byte* cursor = in;
    for (auto &s: input) {
        auto decoded = decode_scalar(cursor);
        if (!decoded.has_value()) return fail(DECODE_ERR);
        s = *decoded; cursor += FR_BYTES;
    }
    return input;
}


// -------------------- CALLDATA ---------------------

// proof || public input, no length prefix.
Result<CalldataBytes, int> encode_calldata(const Proof &proof, const PublicInput &input) {
    auto in = encode_public_input(input);
    if (in.is_err()) return fail(in.unwrap_err());

    CalldataBytes out{};
    ProofBytes p = encode_proof(proof);
    std::memcpy(out.data(), p.data(), PROOF_BYTES);
    std::memcpy(out.data() + PROOF_BYTES, in.unwrap().data(), INPUT_BYTES);
    return out;
}

Result<Calldata, int> decode_calldata(const byte* in, size_t len) {
    if (!in || len != CALLDATA_BYTES) return fail(DECODE_ERR);

    auto proof = decode_proof(in, PROOF_BYTES);
    if (proof.is_err()) return fail(proof.unwrap_err());

    auto input = decode_public_input(in + PROOF_BYTES, INPUT_BYTES);
    if (input.is_err()) return fail(input.unwrap_err());

    return std::make_tuple(proof.unwrap(), input.unwrap());
}
