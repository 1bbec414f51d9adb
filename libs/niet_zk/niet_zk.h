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


// niet_zk.h
#pragma once
#include "codes.h"
#include "circuit.h"
#include "export.h"
#include "files.h"
#include "groth16.h"
#include "native_host.h"
#include "rng.h"
#include "sandbox.h"
#include "serialize.h"
#include "verifier.h"
