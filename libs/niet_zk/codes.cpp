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


// codes.cpp
#include "codes.h"

extern "C" {

// exported for the outer layers
extern const int NIET_OK                     = OK;
extern const int NIET_CONFIGURATION_ERR      = CONFIGURATION_ERR;
extern const int NIET_UNSATISFIED_CONSTRAINT = UNSATISFIED_CONSTRAINT;
extern const int NIET_DECODE_ERR             = DECODE_ERR;
extern const int NIET_HOST_FAULT             = HOST_FAULT;
extern const int NIET_VERIFICATION_FAILED    = VERIFICATION_FAILED;
extern const int NIET_INVALID_SCALAR         = INVALID_SCALAR;
extern const int NIET_NULL_PARAMETER         = NULL_PARAMETER;
extern const int NIET_IO_ERR                 = IO_ERR;
extern const int NIET_ALLOC_ERR              = ALLOC_ERR;

}
