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


#include <cstdio>
#include <string>
#include <unistd.h>
#include "export.h"
#include "files.h"
#include "groth16.h"
#include "verifier.h"
#include "tests.h"

struct Fixture {
    KeyPair keys;
    Proof proof;
    PublicInput input;
};

static Fixture make_fixture() {
    SeededRng rng(FIXTURE_SEED);
    auto keys = setup(rng);
    assert(keys.is_ok());
    auto proof = prove(keys.unwrap().pk, new_scalar(7), new_scalar(8), new_scalar(56), rng);
    assert(proof.is_ok());
    return {keys.unwrap(), proof.unwrap(), {new_scalar(56)}};
}

void test_artifact_roundtrip(const Fixture &f) {
    ProofBytes proof = encode_proof(f.proof);
    auto proof_back = decode_proof(proof.data(), proof.size());
    assert(proof_back.is_ok());
    assert(p1_equal(proof_back.unwrap().a, f.proof.a));
    assert(p2_equal(proof_back.unwrap().b, f.proof.b));
    assert(p1_equal(proof_back.unwrap().c, f.proof.c));

    VkBytes vk = encode_verifying_key(f.keys.vk);
    auto vk_back = decode_verifying_key(vk.data(), vk.size());
    assert(vk_back.is_ok());
    assert(encode_verifying_key(vk_back.unwrap()) == vk);

    PkBytes pk = encode_proving_key(f.keys.pk);
    auto pk_back = decode_proving_key(pk.data(), pk.size());
    assert(pk_back.is_ok());
    assert(encode_proving_key(pk_back.unwrap()) == pk);

    CalldataBytes calldata = encode_calldata(f.proof, f.input).unwrap();
    assert(std::memcmp(calldata.data(), proof.data(), PROOF_BYTES) == 0);
    auto cd_back = decode_calldata(calldata.data(), calldata.size());
    assert(cd_back.is_ok());
    auto &[cd_proof, cd_input] = cd_back.unwrap();
    assert(p1_equal(cd_proof.a, f.proof.a));
    assert(cd_input.size() == NUM_INPUTS);
    assert(equal_scalars(cd_input[0], new_scalar(56)));

    // a decoded proving key still proves
    SystemRng rng;
    auto again = prove(pk_back.unwrap(), new_scalar(3), new_scalar(5), new_scalar(15), rng);
    assert(again.is_ok());
    assert(verify_proof(vk_back.unwrap(), again.unwrap(), {new_scalar(15)}));
    printf("ARTIFACT ROUNDTRIP SUCCESS\n\n");
}

void test_decode_rejects(const Fixture &f) {
    ProofBytes proof = encode_proof(f.proof);
    VkBytes vk = encode_verifying_key(f.keys.vk);
    InputBytes input = encode_public_input(f.input).unwrap();

    // lengths
    assert(decode_proof(proof.data(), proof.size() - 1).unwrap_err() == DECODE_ERR);
    assert(decode_proof(nullptr, PROOF_BYTES).unwrap_err() == DECODE_ERR);
    assert(decode_verifying_key(vk.data(), vk.size() + 1).unwrap_err() == DECODE_ERR);
    assert(decode_public_input(input.data(), 0).unwrap_err() == DECODE_ERR);
    assert(decode_calldata(proof.data(), proof.size()).unwrap_err() == DECODE_ERR);

    // compression flag cleared on A
    ProofBytes bad = proof;
    bad[PROOF_A_OFFSET] &= 0x7f;
    assert(decode_proof(bad.data(), bad.size()).unwrap_err() == DECODE_ERR);

    // (0, 2) is on E1 but 3-torsion, outside G1
    bad = proof;
    std::memset(bad.data() + PROOF_C_OFFSET, 0, G1_BYTES);
    bad[PROOF_C_OFFSET] = 0x80;
    assert(decode_proof(bad.data(), bad.size()).unwrap_err() == DECODE_ERR);

    // public input == r
    std::vector<byte> r_bytes(FR_BYTES);
    field_order_bytes(r_bytes.data());
    assert(decode_public_input(r_bytes.data(), r_bytes.size()).unwrap_err() == DECODE_ERR);

    int rc = verify_encoded(vk.data(), vk.size(), proof.data(), proof.size(), r_bytes.data(), r_bytes.size());
    assert(rc == DECODE_ERR);
    printf("DECODE REJECTS SUCCESS\n\n");
}

// inputs the decoders would refuse never get encoded
void test_encode_rejects(const Fixture &f) {
    blst_scalar over_r;
    field_order_bytes(over_r.b);
    blst_scalar all_ones;
    std::memset(all_ones.b, 0xff, sizeof(all_ones.b));

    assert(encode_public_input({}).unwrap_err() == DECODE_ERR);
    assert(encode_public_input({new_scalar(56), new_scalar(56)}).unwrap_err() == DECODE_ERR);
    assert(encode_public_input({over_r}).unwrap_err() == INVALID_SCALAR);
    assert(encode_public_input({all_ones}).unwrap_err() == INVALID_SCALAR);
    assert(encode_public_input({field_order_minus_one()}).is_ok());

    assert(encode_calldata(f.proof, {}).unwrap_err() == DECODE_ERR);
    assert(encode_calldata(f.proof, {new_scalar(56), new_scalar(7)}).unwrap_err() == DECODE_ERR);
    assert(encode_calldata(f.proof, {all_ones}).unwrap_err() == INVALID_SCALAR);

    // nothing is written on failure
    const std::string dir = "/tmp/niet_zk_reject_" + std::to_string(getpid()) + "_";
    assert(save_public_input(dir + PUBLIC_INPUT_FILE, {}) == DECODE_ERR);
    assert(save_calldata(dir + CALLDATA_FILE, f.proof, {over_r}) == INVALID_SCALAR);
    assert(load_bytes(dir + PUBLIC_INPUT_FILE).unwrap_err() == IO_ERR);
    assert(load_bytes(dir + CALLDATA_FILE).unwrap_err() == IO_ERR);
    printf("ENCODE REJECTS SUCCESS\n\n");
}

// every single-byte change to the proof is rejected
void test_tampered_proof(const Fixture &f) {
    ProofBytes proof = encode_proof(f.proof);
    VkBytes vk = encode_verifying_key(f.keys.vk);
    InputBytes input = encode_public_input(f.input).unwrap();

    assert(verify_encoded(
        vk.data(), vk.size(),
        proof.data(), proof.size(),
        input.data(), input.size()
    ) == OK);

    size_t decode_errs = 0, failures = 0;
    for (size_t i{}; i < PROOF_BYTES; i++) {
        for (byte mask: {byte(0x01), byte(0x80)}) {
            ProofBytes tampered = proof;
            tampered[i] ^= mask;
            int rc = verify_encoded(
                vk.data(), vk.size(),
                tampered.data(), tampered.size(),
                input.data(), input.size()
            );
            assert(rc == DECODE_ERR || rc == VERIFICATION_FAILED);
            if (rc == DECODE_ERR) decode_errs++;
            else failures++;
        }
    }
    printf("tampered proofs: %zu decode errors, %zu verification failures\n", decode_errs, failures);

    InputBytes wrong = encode_public_input({new_scalar(55)}).unwrap();
    assert(verify_encoded(
        vk.data(), vk.size(),
        proof.data(), proof.size(),
        wrong.data(), wrong.size()
    ) == VERIFICATION_FAILED);
    printf("TAMPERED PROOF SUCCESS\n\n");
}

void test_files(const Fixture &f) {
    const std::string dir = "/tmp/niet_zk_test_" + std::to_string(getpid()) + "_";

    assert(save_proving_key(dir + PROVING_KEY_FILE, f.keys.pk) == OK);
    assert(save_verifying_key(dir + VERIFYING_KEY_FILE, f.keys.vk) == OK);
    assert(save_proof(dir + PROOF_FILE, f.proof) == OK);
    assert(save_public_input(dir + PUBLIC_INPUT_FILE, f.input) == OK);
    assert(save_calldata(dir + CALLDATA_FILE, f.proof, f.input) == OK);

    auto pk = load_proving_key(dir + PROVING_KEY_FILE);
    auto vk = load_verifying_key(dir + VERIFYING_KEY_FILE);
    auto proof = load_proof(dir + PROOF_FILE);
    auto input = load_public_input(dir + PUBLIC_INPUT_FILE);
    auto calldata = load_calldata(dir + CALLDATA_FILE);
    assert(pk.is_ok() && vk.is_ok() && proof.is_ok() && input.is_ok() && calldata.is_ok());

    assert(encode_proving_key(pk.unwrap()) == encode_proving_key(f.keys.pk));
    assert(verify_proof(vk.unwrap(), proof.unwrap(), input.unwrap()));

    auto raw = load_bytes(dir + CALLDATA_FILE);
    assert(raw.is_ok() && raw.unwrap().size() == CALLDATA_BYTES);
    assert(verify_calldata(vk.unwrap(), raw.unwrap().data(), raw.unwrap().size()) == OK);

    // a proof file is not a verifying key
    assert(load_verifying_key(dir + PROOF_FILE).unwrap_err() == DECODE_ERR);
    assert(load_proof("/nonexistent/niet_zk/proof.bin").unwrap_err() == IO_ERR);
    assert(save_proof("/nonexistent/niet_zk/proof.bin", f.proof) == IO_ERR);

    for (auto name: {PROVING_KEY_FILE, VERIFYING_KEY_FILE, PROOF_FILE, PUBLIC_INPUT_FILE, CALLDATA_FILE})
        std::remove((dir + name).c_str());
    printf("FILES SUCCESS\n\n");
}

void test_export(const Fixture &f) {
    std::string src = export_verifying_key_cpp(f.keys.vk);
    assert(src.find("extern \"C\" const uint8_t NIET_EMBEDDED_VK[432]") != std::string::npos);
    assert(src.find("extern \"C\" const size_t NIET_EMBEDDED_VK_SIZE = 432;") != std::string::npos);

    // first byte of alpha_g1 appears first in the initializer
    VkBytes vk = encode_verifying_key(f.keys.vk);
    char first[8];
    snprintf(first, sizeof(first), "0x%02x,", vk[0]);
    size_t open = src.find('{');
    assert(open != std::string::npos);
    assert(src.find(first, open) == src.find("0x", open));

    std::string other = export_verifying_key_cpp(f.keys.vk, "OTHER_VK");
    assert(other.find("OTHER_VK_SIZE") != std::string::npos);
    printf("EXPORT SUCCESS\n\n");
}

void main_serialize() {
    printf("TESTING SERIALIZATION & FILES \n");
    Fixture f = make_fixture();
    test_artifact_roundtrip(f);
    test_decode_rejects(f);
    test_encode_rejects(f);
    test_tampered_proof(f);
    test_files(f);
    test_export(f);
    printf("=====================================\n");
}
