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

#pragma once
#include "utils.h"
#include <optional>
#include <tuple>

// Coefficient form throughout, index i holds the x^i coefficient.

// P(x) * (x + w)
Polynomial multiply_binomial(
    const Polynomial &P,
    const blst_scalar &w
);

Polynomial multiply_polynomials(const Polynomial &a, const Polynomial &b);
Polynomial subtract_polynomials(const Polynomial &a, const Polynomial &b);
blst_scalar eval_poly(const Polynomial &P, const blst_scalar &x);
bool poly_is_zero(const Polynomial &P);

// prod (x - d_i)
Polynomial vanishing_polynomial(const Scalar_vec &domain);

// L_j(x) for every domain point j, evaluated at x.
// nullopt on repeated domain points.
std::optional<Scalar_vec> lagrange_basis_at(
    const Scalar_vec &domain,
    const blst_scalar &x
);

// unique polynomial of degree < |domain| through (domain[j], evals[j])
std::optional<Polynomial> interpolate(
    const Scalar_vec &domain,
    const Scalar_vec &evals
);

// (quotient, remainder); den must have a non-zero leading coefficient
std::optional<std::tuple<Polynomial, Polynomial>> divide_polynomials(
    const Polynomial &num,
    const Polynomial &den
);
