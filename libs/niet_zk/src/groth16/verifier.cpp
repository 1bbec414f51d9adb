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
#include "verifier.h"


PreparedVerifyingKey prepare_verifying_key(const VerifyingKey &vk) {
    PreparedVerifyingKey pvk;

    miller_loop_or_one(
        pvk.alpha_beta_ml,
        p2_to_affine(vk.beta_g2),
        p1_to_affine(vk.alpha_g1)
    );

    blst_p2 neg = vk.gamma_g2;
    blst_p2_cneg(&neg, true);
    pvk.neg_gamma = p2_to_affine(neg);

    neg = vk.delta_g2;
    blst_p2_cneg(&neg, true);
    pvk.neg_delta = p2_to_affine(neg);

    pvk.ic = vk.ic;
    return pvk;
}

bool verify_proof(
    const PreparedVerifyingKey &pvk,
    const Proof &proof,
    const PublicInput &inputs
) {
    if (inputs.size() != NUM_INPUTS) return false;

    blst_p1 L = pvk.ic[0];
    blst_p1 term;
    for (size_t i{}; i < NUM_INPUTS; i++) {
        if (!scalar_is_canonical(inputs[i])) return false;
        p1_mult(term, pvk.ic[i + 1], inputs[i]);
        p1_add_inplace(L, term);
    }

    // e(A, B) * e(L, -gamma) * e(C, -delta) == e(alpha, beta)
    blst_fp12 acc, ml;
    miller_loop_or_one(acc, p2_to_affine(proof.b), p1_to_affine(proof.a));

    miller_loop_or_one(ml, pvk.neg_gamma, p1_to_affine(L));
    blst_fp12_mul(&acc, &acc, &ml);

    miller_loop_or_one(ml, pvk.neg_delta, p1_to_affine(proof.c));
    blst_fp12_mul(&acc, &acc, &ml);

    return blst_fp12_finalverify(&acc, &pvk.alpha_beta_ml);
}

bool verify_proof(
    const VerifyingKey &vk,
    const Proof &proof,
    const PublicInput &inputs
) {
    return verify_proof(prepare_verifying_key(vk), proof, inputs);
}

int verify_encoded(
    const byte* vk, size_t vk_len,
    const byte* proof, size_t proof_len,
    const byte* input, size_t input_len
) {
    auto key = decode_verifying_key(vk, vk_len);
    if (key.is_err()) return key.unwrap_err();

    auto p = decode_proof(proof, proof_len);
    if (p.is_err()) return p.unwrap_err();

    auto in = decode_public_input(input, input_len);
    if (in.is_err()) return in.unwrap_err();

    return verify_proof(key.unwrap(), p.unwrap(), in.unwrap())
        ? OK : VERIFICATION_FAILED;
}

int verify_calldata(
    const VerifyingKey &vk,
    const byte* calldata,
    size_t len
) {
    auto decoded = decode_calldata(calldata, len);
    if (decoded.is_err()) return decoded.unwrap_err();

    auto &[proof, inputs] = decoded.unwrap();
    return verify_proof(vk, proof, inputs) ? OK : VERIFICATION_FAILED;
}
