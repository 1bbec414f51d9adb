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
#include <string>
#include "keys.h"

const std::string EMBEDDED_VK_SYMBOL = "NIET_EMBEDDED_VK";

// C++ translation unit defining
//   extern "C" const uint8_t <symbol>[VK_BYTES]
//   extern "C" const size_t  <symbol>_SIZE
// holding the encoded verifying key.
std::string export_verifying_key_cpp(
    const VerifyingKey &vk,
    const std::string &symbol = EMBEDDED_VK_SYMBOL
);
