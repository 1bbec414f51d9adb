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

#include <cerrno>
#include <sys/random.h>
#include "codes.h"
#include "rng.h"

const size_t MAX_DRAWS = 8;

// -------------------- SEEDED -----------------------

SeededRng::SeededRng(uint64_t seed) :
    seed_(seeded_hash(seed)),
    counter_(0),
    valid_(true)
{}

SeededRng::SeededRng(const byte* seed, size_t seed_len) :
    counter_(0),
    valid_(seed != nullptr && seed_len > 0)
{
    if (valid_) seed_ = derive_hash({seed, seed_len});
    else seed_.fill(0);
}

SeededRng::~SeededRng() {
    volatile byte* p = seed_.data();
    for (size_t i = 0; i < seed_.size(); i++) p[i] = 0;
}

int SeededRng::fill(byte* out, size_t len) {
    if (!valid_) return CONFIGURATION_ERR;

    BlakeHasher hasher;
    hasher.update(SEED_TAG);
    hasher.update(seed_.data(), seed_.size());
    hasher.update_u64(counter_++);
    hasher.finalize(out, len);
    return OK;
}

// -------------------- SYSTEM -----------------------

int SystemRng::fill(byte* out, size_t len) {
    size_t filled = 0;
    while (filled < len) {
        ssize_t n = getrandom(out + filled, len - filled, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return CONFIGURATION_ERR;
        }
        filled += static_cast<size_t>(n);
    }
    return OK;
}

// -------------------- SCALARS ----------------------

Result<blst_scalar, int> draw_scalar(Rng &rng) {
    byte buff[SCALAR_DRAW_BYTES];
    int rc = rng.fill(buff, sizeof(buff));
    if (rc != OK) return fail(rc);

    blst_scalar s;
    blst_scalar_from_le_bytes(&s, buff, sizeof(buff));
    std::memset(buff, 0, sizeof(buff));
    return s;
}

Result<blst_scalar, int> draw_nonzero_scalar(Rng &rng) {
    for (size_t i{}; i < MAX_DRAWS; i++) {
        auto s = draw_scalar(rng);
        if (s.is_err()) return s;
        if (!scalar_is_zero(s.unwrap())) return s;
    }
    // a source stuck on zero has no entropy worth using
    return fail(CONFIGURATION_ERR);
}
