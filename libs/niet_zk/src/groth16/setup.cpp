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

const size_t MAX_TAU_DRAWS = 8;

struct ToxicWaste {
    blst_scalar tau;
    blst_scalar alpha;
    blst_scalar beta;
    blst_scalar gamma;
    blst_scalar delta;

    ~ToxicWaste() {
        wipe_scalar(tau);
        wipe_scalar(alpha);
        wipe_scalar(beta);
        wipe_scalar(gamma);
        wipe_scalar(delta);
    }
};

static Result<blst_scalar, int> draw_tau(Rng &rng) {
    for (size_t i{}; i < MAX_TAU_DRAWS; i++) {
        auto tau = draw_nonzero_scalar(rng);
        if (tau.is_err()) return tau;
        if (!in_domain(tau.unwrap())) return tau;
    }
    return fail(CONFIGURATION_ERR);
}

static int draw_toxic_waste(ToxicWaste &tw, Rng &rng) {
    auto tau = draw_tau(rng);
    if (tau.is_err()) return tau.unwrap_err();
    tw.tau = tau.unwrap();

    blst_scalar* rest[] = {&tw.alpha, &tw.beta, &tw.gamma, &tw.delta};
    for (auto s: rest) {
        auto drawn = draw_nonzero_scalar(rng);
        if (drawn.is_err()) return drawn.unwrap_err();
        *s = drawn.unwrap();
    }
    return OK;
}

// beta * u + alpha * v + w
static blst_scalar linear_term(
    const ToxicWaste &tw,
    const QAPEvals &q,
    size_t wire
) {
    blst_scalar k = scalar_mul(tw.beta, q.u[wire]);
    scalar_add_inplace(k, scalar_mul(tw.alpha, q.v[wire]));
    scalar_add_inplace(k, q.w[wire]);
    return k;
}

Result<KeyPair, int> setup(Rng &rng) {
    ToxicWaste tw;
    int rc = draw_toxic_waste(tw, rng);
    if (rc != OK) return fail(rc);

    auto qap = qap_at(tw.tau);
    if (!qap.has_value()) return fail(CONFIGURATION_ERR);
    QAPEvals &q = *qap;

    blst_scalar gamma_inv = inv_scalar(tw.gamma);
    blst_scalar delta_inv = inv_scalar(tw.delta);

    KeyPair keys;
    ProvingKey &pk = keys.pk;
    VerifyingKey &vk = keys.vk;

    pk.alpha_g1 = g1_mul(tw.alpha);
    pk.beta_g1 = g1_mul(tw.beta);
    pk.beta_g2 = g2_mul(tw.beta);
    pk.delta_g1 = g1_mul(tw.delta);
    pk.delta_g2 = g2_mul(tw.delta);

    for (size_t i{}; i < NUM_VARIABLES; i++) {
        pk.a_query[i] = g1_mul(q.u[i]);
        pk.b_g1_query[i] = g1_mul(q.v[i]);
        pk.b_g2_query[i] = g2_mul(q.v[i]);
    }

    // tau^k * Z(tau) / delta
    blst_scalar t = scalar_mul(q.z, delta_inv);
    for (size_t k{}; k < H_SIZE; k++) {
        pk.h_query[k] = g1_mul(t);
        scalar_mul_inplace(t, tw.tau);
    }
    wipe_scalar(t);

    for (size_t i{}; i < NUM_VARIABLES; i++) {
        blst_scalar k = linear_term(tw, q, i);
        if (i < NUM_PUBLIC) {
            scalar_mul_inplace(k, gamma_inv);
            vk.ic[i] = g1_mul(k);
        } else {
            scalar_mul_inplace(k, delta_inv);
            pk.l_query[i - NUM_PUBLIC] = g1_mul(k);
        }
        wipe_scalar(k);
    }

    vk.alpha_g1 = pk.alpha_g1;
    vk.beta_g2 = pk.beta_g2;
    vk.gamma_g2 = g2_mul(tw.gamma);
    vk.delta_g2 = pk.delta_g2;

    wipe_scalar(gamma_inv);
    wipe_scalar(delta_inv);
    wipe_scalars(q.u);
    wipe_scalars(q.v);
    wipe_scalars(q.w);
    wipe_scalar(q.z);
    return keys;
}
