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


#include "contract.h"

const ZkHostImports& linked_host_imports() {
    static const ZkHostImports imports = {
        zk_host_g1_add,
        zk_host_g1_mul,
        zk_host_pairing_check,
    };
    return imports;
}

extern "C" uint32_t zk_contract_verify(const uint8_t* calldata, size_t len) {
    return sandbox_verify(
        linked_host_imports(),
        NIET_EMBEDDED_VK, NIET_EMBEDDED_VK_SIZE,
        calldata, len
    );
}
