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


#include "contract.h"
#include "groth16.h"
#include "native_host.h"
#include "serialize.h"
#include "verifier.h"
#include "tests.h"

static int32_t faulting_g1_mul(const uint8_t*, const uint8_t*, uint8_t*) {
    return HOST_FAULT;
}

static int32_t faulting_pairing(const uint8_t*, size_t, uint8_t*) {
    return HOST_FAULT;
}

// native add handed a null output buffer
static int32_t null_out_g1_add(const uint8_t* p, const uint8_t* q, uint8_t*) {
    return zk_host_g1_add(p, q, nullptr);
}

static int32_t rejecting_pairing(const uint8_t*, size_t, uint8_t*) {
    return DECODE_ERR;
}

// sandbox accepts exactly when the host verifier does
static uint32_t check_agreement(
    const VerifyingKey &vk,
    const VkBytes &vk_bytes,
    const byte* calldata,
    size_t len
) {
    uint32_t sandboxed = sandbox_verify(native_host_imports(), vk_bytes.data(), vk_bytes.size(), calldata, len);
    int host = verify_calldata(vk, calldata, len);

    assert(sandboxed != SANDBOX_FAULT);
    assert((sandboxed == SANDBOX_VALID) == (host == OK));
    if (host == DECODE_ERR) assert(sandboxed == SANDBOX_INVALID);
    return sandboxed;
}

void test_field_order_check() {
    byte buff[FR_BYTES];
    blst_scalar top = field_order_minus_one();
    assert(below_field_order(top.b));
    assert(below_field_order(ZERO_SK.b));

    field_order_bytes(buff);
    assert(!below_field_order(buff));

    std::memset(buff, 0xff, sizeof(buff));
    assert(!below_field_order(buff));
    printf("FIELD ORDER CHECK SUCCESS\n\n");
}

void test_native_host() {
    blst_p1 g = g1_mul(ONE_SK);
    blst_p1 g3 = g1_mul(new_scalar(3));

    byte p[G1_BYTES], q[G1_BYTES], out[G1_BYTES], k[FR_BYTES];
    encode_g1(p, g);
    encode_g1(q, g1_mul(new_scalar(2)));

    assert(zk_host_g1_add(p, q, out) == OK);
    assert(p1_equal(*decode_g1(out), g3));

    encode_scalar(k, new_scalar(3));
    assert(zk_host_g1_mul(p, k, out) == OK);
    assert(p1_equal(*decode_g1(out), g3));

    // k = r - 1 negates
    encode_scalar(k, field_order_minus_one());
    assert(zk_host_g1_mul(p, k, out) == OK);
    blst_p1 neg = g;
    blst_p1_cneg(&neg, true);
    assert(p1_equal(*decode_g1(out), neg));

    field_order_bytes(k);
    assert(zk_host_g1_mul(p, k, out) == DECODE_ERR);

    byte bad[G1_BYTES] = {0};
    assert(zk_host_g1_add(p, bad, out) == DECODE_ERR);
    assert(zk_host_g1_add(nullptr, q, out) == HOST_FAULT);
    assert(zk_host_g1_mul(p, k, nullptr) == HOST_FAULT);

    // e(g, h) * e(-g, h) == 1
    byte pairs[2 * PAIR_BYTES];
    encode_g1(pairs, g);
    encode_g2(pairs + G1_BYTES, g2_mul(ONE_SK));
    encode_g1(pairs + PAIR_BYTES, neg);
    encode_g2(pairs + PAIR_BYTES + G1_BYTES, g2_mul(ONE_SK));

    uint8_t ok = 0;
    assert(zk_host_pairing_check(pairs, 2, &ok) == OK && ok == 1);
    assert(zk_host_pairing_check(pairs, 1, &ok) == OK && ok == 0);
    assert(zk_host_pairing_check(pairs, 0, &ok) == OK && ok == 1);
    assert(zk_host_pairing_check(pairs, 1, nullptr) == HOST_FAULT);
    assert(zk_host_pairing_check(nullptr, 1, &ok) == HOST_FAULT);
    printf("NATIVE HOST SUCCESS\n\n");
}

void test_sandbox_agreement() {
    SeededRng rng(FIXTURE_SEED);
    auto keys = setup(rng);
    assert(keys.is_ok());
    const VerifyingKey &vk = keys.unwrap().vk;
    VkBytes vk_bytes = encode_verifying_key(vk);

    auto proof = prove(keys.unwrap().pk, new_scalar(7), new_scalar(8), new_scalar(56), rng);
    assert(proof.is_ok());

    CalldataBytes valid = encode_calldata(proof.unwrap(), {new_scalar(56)}).unwrap();
    assert(check_agreement(vk, vk_bytes, valid.data(), valid.size()) == SANDBOX_VALID);

    for (uint64_t c: {55ull, 57ull, 0ull}) {
        CalldataBytes wrong = encode_calldata(proof.unwrap(), {new_scalar(c)}).unwrap();
        assert(check_agreement(vk, vk_bytes, wrong.data(), wrong.size()) == SANDBOX_INVALID);
    }

    // input == r
    CalldataBytes over = valid;
    field_order_bytes(over.data() + PROOF_BYTES);
    assert(check_agreement(vk, vk_bytes, over.data(), over.size()) == SANDBOX_INVALID);

    // lengths
    assert(check_agreement(vk, vk_bytes, valid.data(), valid.size() - 1) == SANDBOX_INVALID);
    assert(check_agreement(vk, vk_bytes, valid.data(), 0) == SANDBOX_INVALID);
    std::vector<byte> longer(valid.begin(), valid.end());
    longer.push_back(0);
    assert(check_agreement(vk, vk_bytes, longer.data(), longer.size()) == SANDBOX_INVALID);

    // every single-byte change
    for (size_t i{}; i < CALLDATA_BYTES; i++) {
        CalldataBytes tampered = valid;
        tampered[i] ^= 0x01;
        assert(check_agreement(vk, vk_bytes, tampered.data(), tampered.size()) == SANDBOX_INVALID);
    }
    printf("SANDBOX AGREEMENT SUCCESS\n\n");
}

void test_host_faults() {
    SeededRng rng(FIXTURE_SEED);
    auto keys = setup(rng);
    assert(keys.is_ok());
    VkBytes vk_bytes = encode_verifying_key(keys.unwrap().vk);
    auto proof = prove(keys.unwrap().pk, new_scalar(7), new_scalar(8), new_scalar(56), rng);
    CalldataBytes valid = encode_calldata(proof.unwrap(), {new_scalar(56)}).unwrap();

    ZkHostImports host = native_host_imports();
    host.g1_mul = faulting_g1_mul;
    assert(sandbox_verify(host, vk_bytes.data(), vk_bytes.size(), valid.data(), valid.size()) == SANDBOX_FAULT);

    host = native_host_imports();
    host.pairing_check = faulting_pairing;
    assert(sandbox_verify(host, vk_bytes.data(), vk_bytes.size(), valid.data(), valid.size()) == SANDBOX_FAULT);

    host.pairing_check = rejecting_pairing;
    assert(sandbox_verify(host, vk_bytes.data(), vk_bytes.size(), valid.data(), valid.size()) == SANDBOX_INVALID);

    host = native_host_imports();
    host.g1_add = null_out_g1_add;
    assert(sandbox_verify(host, vk_bytes.data(), vk_bytes.size(), valid.data(), valid.size()) == SANDBOX_FAULT);

    host = native_host_imports();
    host.pairing_check = nullptr;
    assert(sandbox_verify(host, vk_bytes.data(), vk_bytes.size(), valid.data(), valid.size()) == SANDBOX_FAULT);

    // embedded key of the wrong size
    assert(sandbox_verify(native_host_imports(), vk_bytes.data(), vk_bytes.size() - 1, valid.data(), valid.size()) == SANDBOX_FAULT);
    printf("HOST FAULTS SUCCESS\n\n");
}

void test_contract() {
    SeededRng rng(NIET_EMBED_SEED);
    auto keys = setup(rng);
    assert(keys.is_ok());

    VkBytes vk_bytes = encode_verifying_key(keys.unwrap().vk);
    assert(NIET_EMBEDDED_VK_SIZE == VK_BYTES);
    assert(std::memcmp(NIET_EMBEDDED_VK, vk_bytes.data(), VK_BYTES) == 0);

    auto proof = prove(keys.unwrap().pk, new_scalar(7), new_scalar(8), new_scalar(56), rng);
    assert(proof.is_ok());

    CalldataBytes valid = encode_calldata(proof.unwrap(), {new_scalar(56)}).unwrap();
    CalldataBytes wrong = encode_calldata(proof.unwrap(), {new_scalar(55)}).unwrap();
    assert(zk_contract_verify(valid.data(), valid.size()) == SANDBOX_VALID);
    assert(zk_contract_verify(wrong.data(), wrong.size()) == SANDBOX_INVALID);
    assert(zk_contract_verify(valid.data(), 100) == SANDBOX_INVALID);
    assert(zk_contract_verify(nullptr, CALLDATA_BYTES) == SANDBOX_INVALID);
    printf("CONTRACT SUCCESS\n\n");
}

void main_sandbox() {
    printf("TESTING SANDBOXED VERIFIER \n");
    test_field_order_check();
    test_native_host();
    test_sandbox_agreement();
    test_host_faults();
    test_contract();
    printf("=====================================\n");
}
