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
#include "keys.h"
#include "result.h"
#include "rng.h"

// Fresh trust root per call. Toxic scalars are wiped before return.
Result<KeyPair, int> setup(Rng &rng);

// Fails fast with UNSATISFIED_CONSTRAINT when a * b != c (mod r),
// INVALID_SCALAR on a non-canonical input.
Result<Proof, int> prove(
    const ProvingKey &pk,
    const blst_scalar &a,
    const blst_scalar &b,
    const blst_scalar &c,
    Rng &rng
);
