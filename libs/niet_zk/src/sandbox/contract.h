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
#include "sandbox.h"

extern "C" {
    // generated at build time by niet_export_vk
    extern const uint8_t NIET_EMBEDDED_VK[VK_BYTES];
    extern const size_t NIET_EMBEDDED_VK_SIZE;

    // 1 valid, 0 invalid, 2 host fault
    uint32_t zk_contract_verify(const uint8_t* calldata, size_t len);
}

// import table bound to the zk_host_* link-time symbols
const ZkHostImports& linked_host_imports();
