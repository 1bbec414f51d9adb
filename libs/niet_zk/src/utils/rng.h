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
#include "hashing.h"
#include "result.h"
#include "utils.h"

const std::string SEED_TAG = "niet_zk/seeded_rng/v1";

// bytes drawn per scalar, reduced mod r
const size_t SCALAR_DRAW_BYTES = 64;


/////////////////////////////////////////////////
//////////    RNG VIRTUAL CLASS     ////////////
///////////////////////////////////////////////

// Every Setup / Prover call takes one of these explicitly.
// fill() returns OK or CONFIGURATION_ERR.
class Rng {
public:
    virtual int fill(byte* out, size_t len) = 0;
    virtual ~Rng() {};
};

// Deterministic stream: BLAKE3(tag || seed || counter) in XOF mode.
// For reproducible fixtures only.
class SeededRng : public Rng {
private:
    Hash seed_;
    uint64_t counter_;
    bool valid_;

public:
    explicit SeededRng(uint64_t seed);
    SeededRng(const byte* seed, size_t seed_len);
    ~SeededRng();

    int fill(byte* out, size_t len) override;
};

// Kernel entropy via getrandom(2).
class SystemRng : public Rng {
public:
    int fill(byte* out, size_t len) override;
};

// uniform scalar in [0, r)
Result<blst_scalar, int> draw_scalar(Rng &rng);

// uniform scalar in [1, r), bounded retries on zero
Result<blst_scalar, int> draw_nonzero_scalar(Rng &rng);
