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

#include "circuit.h"


Circuit make_circuit(
    const blst_scalar &a,
    const blst_scalar &b,
    const blst_scalar &c
) {
    return {a, b, c};
}

Scalar_vec circuit_witness(const Circuit &circuit) {
    Scalar_vec z(NUM_VARIABLES, ZERO_SK);
    z[ONE_WIRE] = ONE_SK;
    z[C_WIRE] = circuit.c;
    z[A_WIRE] = circuit.a;
    z[B_WIRE] = circuit.b;
    return z;
}

PublicInput circuit_public_input(const Circuit &circuit) {
    return {circuit.c};
}

static blst_scalar row_dot(
    const std::array<uint64_t, NUM_VARIABLES> &row,
    const Scalar_vec &z
) {
    blst_scalar acc = ZERO_SK;
    for (size_t i{}; i < NUM_VARIABLES; i++) {
        if (row[i] == 0) continue;
        scalar_add_inplace(acc, scalar_mul(new_scalar(row[i]), z[i]));
    }
    return acc;
}

bool is_satisfied(const Circuit &circuit) {
    Scalar_vec z = circuit_witness(circuit);
    bool ok = true;
    for (size_t j{}; j < NUM_CONSTRAINTS; j++) {
        blst_scalar ab = scalar_mul(row_dot(A_MATRIX[j], z), row_dot(B_MATRIX[j], z));
        if (!equal_scalars(ab, row_dot(C_MATRIX[j], z))) ok = false;
    }
    wipe_scalars(z);
    return ok;
}

const Scalar_vec& evaluation_domain() {
    static const Scalar_vec domain = {
        new_scalar(1),
        new_scalar(2),
        new_scalar(3),
    };
    return domain;
}

bool in_domain(const blst_scalar &x) {
    for (auto &d: evaluation_domain())
        if (equal_scalars(d, x)) return true;
    return false;
}

std::optional<QAPEvals> qap_at(const blst_scalar &tau) {
    if (in_domain(tau)) return std::nullopt;

    auto basis = lagrange_basis_at(evaluation_domain(), tau);
    if (!basis.has_value()) return std::nullopt;

    QAPEvals q{
        Scalar_vec(NUM_VARIABLES, ZERO_SK),
        Scalar_vec(NUM_VARIABLES, ZERO_SK),
        Scalar_vec(NUM_VARIABLES, ZERO_SK),
        eval_poly(vanishing_polynomial(evaluation_domain()), tau),
    };

    // u_i(tau) = sum_j A[j][i] * L_j(tau), same for v / w
    for (size_t j{}; j < NUM_CONSTRAINTS; j++) {
        const blst_scalar &Lj = (*basis)[j];
        for (size_t i{}; i < NUM_VARIABLES; i++) {
            if (A_MATRIX[j][i]) scalar_add_inplace(q.u[i], scalar_mul(new_scalar(A_MATRIX[j][i]), Lj));
            if (B_MATRIX[j][i]) scalar_add_inplace(q.v[i], scalar_mul(new_scalar(B_MATRIX[j][i]), Lj));
            if (C_MATRIX[j][i]) scalar_add_inplace(q.w[i], scalar_mul(new_scalar(C_MATRIX[j][i]), Lj));
        }
    }

    wipe_scalars(*basis);
    return q;
}

std::optional<Polynomial> compute_h(const Scalar_vec &witness) {
    if (witness.size() != NUM_VARIABLES) return std::nullopt;

    Scalar_vec a_evals(NUM_CONSTRAINTS), b_evals(NUM_CONSTRAINTS), c_evals(NUM_CONSTRAINTS);
    for (size_t j{}; j < NUM_CONSTRAINTS; j++) {
        a_evals[j] = row_dot(A_MATRIX[j], witness);
        b_evals[j] = row_dot(B_MATRIX[j], witness);
        c_evals[j] = row_dot(C_MATRIX[j], witness);
    }

    const Scalar_vec &domain = evaluation_domain();
    auto Ax = interpolate(domain, a_evals);
    auto Bx = interpolate(domain, b_evals);
    auto Cx = interpolate(domain, c_evals);
    wipe_scalars(a_evals);
    wipe_scalars(b_evals);
    wipe_scalars(c_evals);
    if (!Ax || !Bx || !Cx) return std::nullopt;

    Polynomial Px = subtract_polynomials(multiply_polynomials(*Ax, *Bx), *Cx);
    auto division = divide_polynomials(Px, vanishing_polynomial(domain));
    wipe_scalars(*Ax);
    wipe_scalars(*Bx);
    wipe_scalars(*Cx);
    wipe_scalars(Px);
    if (!division.has_value()) return std::nullopt;

    auto &[Hx, rem] = *division;
    if (!poly_is_zero(rem)) return std::nullopt;

    for (size_t k = H_SIZE; k < Hx.size(); k++)
        if (!scalar_is_zero(Hx[k])) return std::nullopt;
    Hx.resize(H_SIZE, ZERO_SK);
    return Hx;
}
