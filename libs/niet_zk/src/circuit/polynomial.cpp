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

#include <algorithm>
#include "polynomial.h"


Polynomial multiply_binomial(const Polynomial &P, const blst_scalar &w) {
    size_t d = P.size();
    Polynomial Q(d + 1, ZERO_SK);

    // Q[i+1] = P[i] (shift)
    // Q[i]   = P[i] * w (added to existing term)
    for (size_t i = 0; i < d; i++) {
        blst_scalar tmp;
        blst_sk_mul_n_check(&tmp, &P[i], &w);
        blst_sk_add_n_check(&Q[i], &Q[i], &tmp);
        blst_sk_add_n_check(&Q[i+1], &Q[i+1], &P[i]);
    }

    return Q;
}

Polynomial multiply_polynomials(const Polynomial &a, const Polynomial &b) {
    if (a.empty() || b.empty()) return {};
    Polynomial out(a.size() + b.size() - 1, ZERO_SK);

    blst_scalar tmp;
    for (size_t i{}; i < a.size(); i++) {
        for (size_t j{}; j < b.size(); j++) {
            blst_sk_mul_n_check(&tmp, &a[i], &b[j]);
            blst_sk_add_n_check(&out[i + j], &out[i + j], &tmp);
        }
    }
    return out;
}

Polynomial subtract_polynomials(const Polynomial &a, const Polynomial &b) {
    Polynomial out(std::max(a.size(), b.size()), ZERO_SK);
    for (size_t i{}; i < a.size(); i++) out[i] = a[i];
    for (size_t i{}; i < b.size(); i++)
        blst_sk_sub_n_check(&out[i], &out[i], &b[i]);
    return out;
}

// Horner
blst_scalar eval_poly(const Polynomial &P, const blst_scalar &x) {
    blst_scalar acc = ZERO_SK;
    for (size_t i = P.size(); i-- > 0;) {
        blst_sk_mul_n_check(&acc, &acc, &x);
        blst_sk_add_n_check(&acc, &acc, &P[i]);
    }
    return acc;
}

bool poly_is_zero(const Polynomial &P) {
    for (auto &c: P) if (!scalar_is_zero(c)) return false;
    return true;
}

Polynomial vanishing_polynomial(const Scalar_vec &domain) {
    Polynomial Z = {ONE_SK};
    for (auto &d: domain) Z = multiply_binomial(Z, neg_scalar(d));
    return Z;
}

// 1 / prod_{k != j} (d_j - d_k)
static std::optional<Scalar_vec> barycentric_weights(const Scalar_vec &domain) {
    size_t n = domain.size();
    Scalar_vec denoms(n, ONE_SK);
    for (size_t j{}; j < n; j++) {
        for (size_t k{}; k < n; k++) {
            if (j == k) continue;
            scalar_mul_inplace(denoms[j], scalar_sub(domain[j], domain[k]));
        }
    }

    Scalar_vec weights;
    if (!batch_inv(weights, denoms)) return std::nullopt;
    return weights;
}

std::optional<Scalar_vec> lagrange_basis_at(
    const Scalar_vec &domain,
    const blst_scalar &x
) {
    auto weights = barycentric_weights(domain);
    if (!weights.has_value()) return std::nullopt;

    size_t n = domain.size();
    Scalar_vec basis(n);
    for (size_t j{}; j < n; j++) {
        blst_scalar num = ONE_SK;
        for (size_t k{}; k < n; k++) {
            if (j == k) continue;
            scalar_mul_inplace(num, scalar_sub(x, domain[k]));
        }
        basis[j] = scalar_mul(num, (*weights)[j]);
    }
    return basis;
}

std::optional<Polynomial> interpolate(
    const Scalar_vec &domain,
    const Scalar_vec &evals
) {
    if (domain.size() != evals.size()) return std::nullopt;

    auto weights = barycentric_weights(domain);
    if (!weights.has_value()) return std::nullopt;

    size_t n = domain.size();
    Polynomial out(n, ZERO_SK);
    for (size_t j{}; j < n; j++) {
        if (scalar_is_zero(evals[j])) continue;

        Polynomial Lj = {ONE_SK};
        for (size_t k{}; k < n; k++) {
            if (j == k) continue;
            Lj = multiply_binomial(Lj, neg_scalar(domain[k]));
        }

        blst_scalar coeff = scalar_mul(evals[j], (*weights)[j]);
        for (size_t i{}; i < Lj.size(); i++)
            scalar_add_inplace(out[i], scalar_mul(Lj[i], coeff));
    }
    return out;
}

std::optional<std::tuple<Polynomial, Polynomial>> divide_polynomials(
    const Polynomial &num,
    const Polynomial &den
) {
    size_t den_deg = den.size();
    while (den_deg > 0 && scalar_is_zero(den[den_deg - 1])) den_deg--;
    if (den_deg == 0) return std::nullopt;
    den_deg--;

    Polynomial rem(num);
    if (rem.size() <= den_deg) {
        return std::make_tuple(Polynomial{ZERO_SK}, rem);
    }

    blst_scalar lead_inv = inv_scalar(den[den_deg]);
    Polynomial quot(rem.size() - den_deg, ZERO_SK);

    blst_scalar tmp;
    for (size_t i = quot.size(); i-- > 0;) {
        // eliminate the x^(i + den_deg) term
        quot[i] = scalar_mul(rem[i + den_deg], lead_inv);
        for (size_t k{}; k <= den_deg; k++) {
            blst_sk_mul_n_check(&tmp, &quot[i], &den[k]);
            blst_sk_sub_n_check(&rem[i + k], &rem[i + k], &tmp);
        }
    }

    rem.resize(den_deg);
    return std::make_tuple(quot, rem);
}
