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
#include "host_abi.h"

constexpr uint32_t SANDBOX_INVALID = 0;
constexpr uint32_t SANDBOX_VALID   = 1;
constexpr uint32_t SANDBOX_FAULT   = 2;

// Fixed-size stack buffers only, a fixed number of host calls.
// Malformed calldata (length, input >= r, undecodable points)
// is SANDBOX_INVALID; any other import failure is SANDBOX_FAULT.
uint32_t sandbox_verify(
    const ZkHostImports &host,
    const uint8_t* vk, size_t vk_len,
    const uint8_t* calldata, size_t len
);

// little-endian integer compare against the scalar field order
bool below_field_order(const uint8_t s[FR_BYTES]);
