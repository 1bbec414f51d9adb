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


// niet_export_vk <seed> <out.cpp> [vk.bin]
//
// Runs setup with SeededRng(seed) and writes the verifying key as a C++
// source file for the contract build, plus the raw key when asked.

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "codes.h"
#include "export.h"
#include "files.h"
#include "groth16.h"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        fprintf(stderr, "usage: %s <seed> <out.cpp> [vk.bin]\n", argv[0]);
        return 1;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long seed = strtoull(argv[1], &end, 10);
    if (errno != 0 || end == argv[1] || *end != '\0') {
        fprintf(stderr, "niet_export_vk: bad seed '%s'\n", argv[1]);
        return 1;
    }

    SeededRng rng(static_cast<uint64_t>(seed));
    auto keys = setup(rng);
    if (keys.is_err()) {
        fprintf(stderr, "niet_export_vk: setup failed: %s\n", code_name(keys.unwrap_err()));
        return 1;
    }
    const VerifyingKey &vk = keys.unwrap().vk;

    std::string source = export_verifying_key_cpp(vk);
    std::ofstream out(argv[2], std::ios::trunc);
    if (!out) {
        fprintf(stderr, "niet_export_vk: cannot open %s\n", argv[2]);
        return 1;
    }
    out << source;
    out.close();
    if (!out) {
        fprintf(stderr, "niet_export_vk: write failed for %s\n", argv[2]);
        return 1;
    }

    if (argc > 3) {
        int rc = save_verifying_key(argv[3], vk);
        if (rc != OK) {
            fprintf(stderr, "niet_export_vk: %s writing %s\n", code_name(rc), argv[3]);
            return 1;
        }
    }

    fprintf(stderr, "niet_export_vk: seed %llu -> %s\n", seed, argv[2]);
    return 0;
}
