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

enum ZkCodes {
    OK = 0,

    CONFIGURATION_ERR = 1,
    UNSATISFIED_CONSTRAINT = 2,
    DECODE_ERR = 3,
    HOST_FAULT = 4,
    VERIFICATION_FAILED = 5,
    INVALID_SCALAR = 6,
    NULL_PARAMETER = 7,
    IO_ERR = 8,
    ALLOC_ERR = 9,
};

inline const char* code_name(int code) {
    switch (code) {
        case OK:                     return "OK";
        case CONFIGURATION_ERR:      return "CONFIGURATION_ERR";
        case UNSATISFIED_CONSTRAINT: return "UNSATISFIED_CONSTRAINT";
        case DECODE_ERR:             return "DECODE_ERR";
        case HOST_FAULT:             return "HOST_FAULT";
        case VERIFICATION_FAILED:    return "VERIFICATION_FAILED";
        case INVALID_SCALAR:         return "INVALID_SCALAR";
        case NULL_PARAMETER:         return "NULL_PARAMETER";
        case IO_ERR:                 return "IO_ERR";
        case ALLOC_ERR:              return "ALLOC_ERR";
    }
    return "UNKNOWN";
}
