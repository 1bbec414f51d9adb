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


// extern.h
#pragma once
#include <cstddef>
#include <cstdint>

// Byte blobs handed out through `out` pointers are malloc'ed and must
// be released with niet_free. Every int return is a ZkCodes value;
// a failed malloc is ALLOC_ERR and leaves `out` null.
extern "C" {
    extern const int NIET_OK;
    extern const int NIET_CONFIGURATION_ERR;
    extern const int NIET_UNSATISFIED_CONSTRAINT;
    extern const int NIET_DECODE_ERR;
    extern const int NIET_HOST_FAULT;
    extern const int NIET_VERIFICATION_FAILED;
    extern const int NIET_INVALID_SCALAR;
    extern const int NIET_NULL_PARAMETER;
    extern const int NIET_IO_ERR;
    extern const int NIET_ALLOC_ERR;

    // seed == nullptr draws the toxic waste from the system rng
    int niet_setup(
        const unsigned char* seed,
        size_t seed_size,
        void** pk_out,
        size_t* pk_size,
        void** vk_out,
        size_t* vk_size
    );

    // seed == nullptr draws the blinding from the system rng
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
    );

    int niet_public_input(
        uint64_t c,
        void** out,
        size_t* out_size
    );

    int niet_verify(
        const unsigned char* vk,
        size_t vk_size,
        const unsigned char* proof,
        size_t proof_size,
        const unsigned char* input,
        size_t input_size
    );

    int niet_calldata(
        const unsigned char* proof,
        size_t proof_size,
        const unsigned char* input,
        size_t input_size,
        void** out,
        size_t* out_size
    );

    int niet_verify_calldata(
        const unsigned char* vk,
        size_t vk_size,
        const unsigned char* calldata,
        size_t calldata_size
    );

    int niet_save(
        const char* path,
        const unsigned char* data,
        size_t size
    );

    int niet_load(
        const char* path,
        void** out,
        size_t* out_size
    );

    void niet_free(void* ptr);
}
