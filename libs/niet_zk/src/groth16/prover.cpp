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
#include "groth16.h"

struct Blinding {
    blst_scalar r;
    blst_scalar s;

    ~Blinding() {
        wipe_scalar(r);
        wipe_scalar(s);
    }
};

// base + sum z_i * query_i
template <typename P, size_t N, typename Mult, typename Add>
static P accumulate(
    P base,
    const std::array<P, N> &query,
    const blst_scalar* z,
    Mult mult,
    Add add
) {
    P term;
    for (size_t i{}; i < N; i++) {
        if (scalar_is_zero(z[i])) continue;
        mult(term, query[i], z[i]);
        add(base, term);
    }
    return base;
}

Result<Proof, int> prove(
    const ProvingKey &pk,
    const blst_scalar &a,
    const blst_scalar &b,
    const blst_scalar &c,
    Rng &rng
) {
    if (!scalar_is_canonical(a) || !scalar_is_canonical(b) || !scalar_is_canonical(c))
        return fail(INVALID_SCALAR);

    Circuit circuit = make_circuit(a, b, c);
    if (!is_satisfied(circuit)) {
        wipe_scalar(circuit.a);
        wipe_scalar(circuit.b);
        return fail(UNSATISFIED_CONSTRAINT);
    }

    Scalar_vec z = circuit_witness(circuit);
    wipe_scalar(circuit.a);
    wipe_scalar(circuit.b);

    auto h = compute_h(z);
    if (!h.has_value()) {
        wipe_scalars(z);
        return fail(UNSATISFIED_CONSTRAINT);
    }

    Blinding bl;
    auto r = draw_scalar(rng);
    auto s = r.is_ok() ? draw_scalar(rng) : r;
    if (r.is_err() || s.is_err()) {
        wipe_scalars(z);
        wipe_scalars(*h);
        return fail(r.is_err() ? r.unwrap_err() : s.unwrap_err());
    }
    bl.r = r.unwrap();
    bl.s = s.unwrap();
    wipe_scalar(r.unwrap());
    wipe_scalar(s.unwrap());

    Proof proof;
    blst_p1 tmp1;
    blst_p2 tmp2;

    // A = alpha + sum z_i u_i(tau) + r delta
    proof.a = accumulate(pk.alpha_g1, pk.a_query, z.data(), p1_mult, p1_add_inplace);
    p1_mult(tmp1, pk.delta_g1, bl.r);
    p1_add_inplace(proof.a, tmp1);

    // B = beta + sum z_i v_i(tau) + s delta, in both groups
    proof.b = accumulate(pk.beta_g2, pk.b_g2_query, z.data(), p2_mult, p2_add_inplace);
    p2_mult(tmp2, pk.delta_g2, bl.s);
    p2_add_inplace(proof.b, tmp2);

    blst_p1 b1 = accumulate(pk.beta_g1, pk.b_g1_query, z.data(), p1_mult, p1_add_inplace);
    p1_mult(tmp1, pk.delta_g1, bl.s);
    p1_add_inplace(b1, tmp1);

    // C = sum_priv z_i l_i + h(tau) Z(tau) / delta + s A + r B1 - r s delta
    proof.c = accumulate(new_inf_p1(), pk.l_query, z.data() + NUM_PUBLIC, p1_mult, p1_add_inplace);
    proof.c = accumulate(proof.c, pk.h_query, h->data(), p1_mult, p1_add_inplace);

    p1_mult(tmp1, proof.a, bl.s);
    p1_add_inplace(proof.c, tmp1);
    p1_mult(tmp1, b1, bl.r);
    p1_add_inplace(proof.c, tmp1);

    blst_scalar rs = neg_scalar(scalar_mul(bl.r, bl.s));
    p1_mult(tmp1, pk.delta_g1, rs);
    p1_add_inplace(proof.c, tmp1);
    wipe_scalar(rs);

    wipe_scalars(z);
    wipe_scalars(*h);
    return proof;
}
