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


// tests.h
#pragma once
#include <cassert>
#include <cstdio>
#include "niet_zk.h"

#ifndef NIET_EMBED_SEED
#define NIET_EMBED_SEED 42
#endif

const uint64_t FIXTURE_SEED = 42;

void main_field();
void main_circuit();
void main_groth16();
void main_serialize();
void main_sandbox();
void main_bindings();

// fills every request with the same byte pattern
class ConstantRng : public Rng {
private:
    byte head_;
public:
    explicit ConstantRng(byte head) : head_(head) {}
    int fill(byte* out, size_t len) override {
        std::memset(out, 0, len);
        if (len > 0) out[0] = head_;
        return OK;
    }
};

class FailingRng : public Rng {
public:
    int fill(byte*, size_t) override { return CONFIGURATION_ERR; }
};

inline blst_scalar field_order_minus_one() {
    return neg_scalar(ONE_SK);
}

// r itself, not representable as a canonical scalar
inline void field_order_bytes(byte out[32]) {
    blst_scalar r_minus_one = field_order_minus_one();
    std::memcpy(out, r_minus_one.b, 32);
    out[0] += 1;
}
