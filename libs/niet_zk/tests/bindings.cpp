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


#include <string>
#include <unistd.h>
#include "extern.h"
#include "layout.h"
#include "tests.h"

struct Blob {
    void* ptr = nullptr;
    size_t size = 0;
    ~Blob() { niet_free(ptr); }
    const unsigned char* data() const { return static_cast<const unsigned char*>(ptr); }
};

void test_binding_flow() {
    const unsigned char seed[] = "42";
    Blob pk, vk, proof, input, calldata;

    assert(niet_setup(seed, 2, &pk.ptr, &pk.size, &vk.ptr, &vk.size) == NIET_OK);
    assert(pk.size == PK_BYTES);
    assert(vk.size == VK_BYTES);

    assert(niet_prove(pk.data(), pk.size, 7, 8, 56, nullptr, 0, &proof.ptr, &proof.size) == NIET_OK);
    assert(proof.size == PROOF_BYTES);

    assert(niet_public_input(56, &input.ptr, &input.size) == NIET_OK);
    assert(input.size == INPUT_BYTES);

    assert(niet_verify(vk.data(), vk.size, proof.data(), proof.size, input.data(), input.size) == NIET_OK);

    assert(niet_calldata(proof.data(), proof.size, input.data(), input.size, &calldata.ptr, &calldata.size) == NIET_OK);
    assert(calldata.size == CALLDATA_BYTES);
    assert(niet_verify_calldata(vk.data(), vk.size, calldata.data(), calldata.size) == NIET_OK);

    Blob wrong;
    assert(niet_public_input(55, &wrong.ptr, &wrong.size) == NIET_OK);
    assert(niet_verify(vk.data(), vk.size, proof.data(), proof.size, wrong.data(), wrong.size) == NIET_VERIFICATION_FAILED);
    assert(niet_verify(vk.data(), vk.size - 1, proof.data(), proof.size, input.data(), input.size) == NIET_DECODE_ERR);
    printf("BINDING FLOW SUCCESS\n\n");
}

void test_binding_errors() {
    const unsigned char seed[] = "42";
    Blob pk, vk, proof;

    assert(niet_setup(seed, 2, &pk.ptr, &pk.size, &vk.ptr, &vk.size) == NIET_OK);

    // same seed, same keys
    Blob pk2, vk2;
    assert(niet_setup(seed, 2, &pk2.ptr, &pk2.size, &vk2.ptr, &vk2.size) == NIET_OK);
    assert(std::memcmp(vk.ptr, vk2.ptr, VK_BYTES) == 0);
    assert(std::memcmp(pk.ptr, pk2.ptr, PK_BYTES) == 0);

    assert(niet_prove(pk.data(), pk.size, 7, 8, 55, nullptr, 0, &proof.ptr, &proof.size) == NIET_UNSATISFIED_CONSTRAINT);
    assert(proof.ptr == nullptr);

    assert(niet_prove(pk.data(), pk.size, 7, 8, 56, seed, 0, &proof.ptr, &proof.size) == NIET_CONFIGURATION_ERR);
    assert(niet_setup(seed, 0, &pk2.ptr, &pk2.size, nullptr, nullptr) == NIET_NULL_PARAMETER);
    assert(niet_prove(nullptr, 0, 7, 8, 56, nullptr, 0, &proof.ptr, &proof.size) == NIET_NULL_PARAMETER);
    assert(niet_prove(pk.data(), pk.size - 1, 7, 8, 56, nullptr, 0, &proof.ptr, &proof.size) == NIET_DECODE_ERR);
    assert(niet_verify(nullptr, 0, nullptr, 0, nullptr, 0) == NIET_NULL_PARAMETER);
    assert(niet_verify_calldata(vk.data(), vk.size, nullptr, 0) == NIET_NULL_PARAMETER);

    // input bytes >= r never reach the calldata encoder
    Blob calldata;
    unsigned char over[INPUT_BYTES];
    std::memset(over, 0xff, sizeof(over));
    assert(niet_prove(pk.data(), pk.size, 7, 8, 56, nullptr, 0, &proof.ptr, &proof.size) == NIET_OK);
    assert(niet_calldata(proof.data(), proof.size, over, sizeof(over), &calldata.ptr, &calldata.size) == NIET_DECODE_ERR);
    assert(calldata.ptr == nullptr);

    // allocation failures have their own code
    assert(NIET_ALLOC_ERR == ALLOC_ERR);
    assert(NIET_ALLOC_ERR != NIET_IO_ERR && NIET_ALLOC_ERR != NIET_OK);
    assert(std::string(code_name(NIET_ALLOC_ERR)) == "ALLOC_ERR");
    printf("BINDING ERRORS SUCCESS\n\n");
}

void test_binding_files() {
    const std::string path = "/tmp/niet_zk_binding_vk_" + std::to_string(getpid()) + ".bin";
    const unsigned char seed[] = "7";
    Blob pk, vk, loaded;

    assert(niet_setup(seed, 1, &pk.ptr, &pk.size, &vk.ptr, &vk.size) == NIET_OK);
    assert(niet_save(path.c_str(), vk.data(), vk.size) == NIET_OK);
    assert(niet_load(path.c_str(), &loaded.ptr, &loaded.size) == NIET_OK);
    assert(loaded.size == VK_BYTES);
    assert(std::memcmp(loaded.ptr, vk.ptr, VK_BYTES) == 0);

    Blob missing;
    assert(niet_load("/nonexistent/niet_zk/vk.bin", &missing.ptr, &missing.size) == NIET_IO_ERR);
    assert(niet_save(nullptr, vk.data(), vk.size) == NIET_NULL_PARAMETER);

    std::remove(path.c_str());
    printf("BINDING FILES SUCCESS\n\n");
}

void main_bindings() {
    printf("TESTING C BINDINGS \n");
    test_binding_flow();
    test_binding_errors();
    test_binding_files();
    printf("=====================================\n");
}
