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


#include <cstdlib>
#include <memory>
#include "codes.h"
#include "extern.h"
#include "files.h"
#include "groth16.h"
#include "verifier.h"

static int copy_out(const byte* data, size_t len, void** out, size_t* out_size) {
    *out = malloc(len);
    if (!*out) return ALLOC_ERR;
    *out_size = len;
    std::memcpy(*out, data, len);
    return OK;
}

static std::unique_ptr<Rng> make_rng(const unsigned char* seed, size_t seed_size) {
    if (!seed) return std::make_unique<SystemRng>();
    return std::make_unique<SeededRng>(seed, seed_size);
}

int niet_setup(
    const unsigned char* seed,
    size_t seed_size,
    void** pk_out,
    size_t* pk_size,
    void** vk_out,
    size_t* vk_size
) {
    if (!pk_out || !pk_size || !vk_out || !vk_size) return NULL_PARAMETER;

    auto rng = make_rng(seed, seed_size);
    auto keys = setup(*rng);
    if (keys.is_err()) return keys.unwrap_err();

    PkBytes pk = encode_proving_key(keys.unwrap().pk);
    VkBytes vk = encode_verifying_key(keys.unwrap().vk);

    int rc = copy_out(pk.data(), pk.size(), pk_out, pk_size);
    if (rc != OK) return rc;

    rc = copy_out(vk.data(), vk.size(), vk_out, vk_size);
    if (rc != OK) {
        free(*pk_out);
        *pk_out = nullptr;
        *pk_size = 0;
    }
    return rc;
}

int niet_prove(
    const unsigned char* pk,
    size_t pk_size,
    uint64_t a,
    uint64_t b,
    uint64_t c,
    const unsigned char* seed,
    size_t seed_size,
    void** proof_out,
    size_t* proof_size
) {
    if (!pk || !proof_out || !proof_size) return NULL_PARAMETER;

    auto key = decode_proving_key(pk, pk_size);
    if (key.is_err()) return key.unwrap_err();

    auto rng = make_rng(seed, seed_size);
    blst_scalar sa = new_scalar(a);
    blst_scalar sb = new_scalar(b);
    auto proof = prove(key.unwrap(), sa, sb, new_scalar(c), *rng);
    wipe_scalar(sa);
    wipe_scalar(sb);
    if (proof.is_err()) return proof.unwrap_err();

    ProofBytes bytes = encode_proof(proof.unwrap());
    return copy_out(bytes.data(), bytes.size(), proof_out, proof_size);
}

int niet_public_input(
    uint64_t c,
    void** out,
    size_t* out_size
) {
    if (!out || !out_size) return NULL_PARAMETER;

    auto bytes = encode_public_input({new_scalar(c)});
    if (bytes.is_err()) return bytes.unwrap_err();
    return copy_out(bytes.unwrap().data(), INPUT_BYTES, out, out_size);
}

int niet_verify(
    const unsigned char* vk,
    size_t vk_size,
    const unsigned char* proof,
    size_t proof_size,
    const unsigned char* input,
    size_t input_size
) {
    if (!vk || !proof || !input) return NULL_PARAMETER;
    return verify_encoded(vk, vk_size, proof, proof_size, input, input_size);
}

int niet_calldata(
    const unsigned char* proof,
    size_t proof_size,
    const unsigned char* input,
    size_t input_size,
    void** out,
    size_t* out_size
) {
    if (!proof || !input || !out || !out_size) return NULL_PARAMETER;

    auto p = decode_proof(proof, proof_size);
    if (p.is_err()) return p.unwrap_err();

    auto in = decode_public_input(input, input_size);
    if (in.is_err()) return in.unwrap_err();

    auto bytes = encode_calldata(p.unwrap(), in.unwrap());
    if (bytes.is_err()) return bytes.unwrap_err();
    return copy_out(bytes.unwrap().data(), CALLDATA_BYTES, out, out_size);
}

int niet_verify_calldata(
    const unsigned char* vk,
    size_t vk_size,
    const unsigned char* calldata,
    size_t calldata_size
) {
    if (!vk || !calldata) return NULL_PARAMETER;

    auto key = decode_verifying_key(vk, vk_size);
    if (key.is_err()) return key.unwrap_err();
    return verify_calldata(key.unwrap(), calldata, calldata_size);
}

int niet_save(
    const char* path,
    const unsigned char* data,
    size_t size
) {
    if (!path || !data) return NULL_PARAMETER;
    return save_bytes(path, data, size);
}

int niet_load(
    const char* path,
    void** out,
    size_t* out_size
) {
    if (!path || !out || !out_size) return NULL_PARAMETER;

    auto data = load_bytes(path);
    if (data.is_err()) return data.unwrap_err();

    auto &bytes = data.unwrap();
    return copy_out(bytes.data(), bytes.size(), out, out_size);
}

void niet_free(void* ptr) {
    free(ptr);
}
