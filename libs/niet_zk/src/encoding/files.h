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
#include "serialize.h"

// one file per artifact, raw wire format, no header
const std::string PROVING_KEY_FILE   = "proving_key.bin";
const std::string VERIFYING_KEY_FILE = "verifying_key.bin";
const std::string PROOF_FILE         = "proof.bin";
const std::string PUBLIC_INPUT_FILE  = "public_input.bin";
const std::string CALLDATA_FILE      = "calldata.bin";

int save_bytes(const std::string &path, const byte* data, size_t len);
Result<std::vector<byte>, int> load_bytes(const std::string &path);

// save_* return OK or IO_ERR, load_* add DECODE_ERR.
// save_public_input and save_calldata pass encoder errors through
// without touching the file.
int save_proving_key(const std::string &path, const ProvingKey &pk);
Result<ProvingKey, int> load_proving_key(const std::string &path);

int save_verifying_key(const std::string &path, const VerifyingKey &vk);
Result<VerifyingKey, int> load_verifying_key(const std::string &path);

int save_proof(const std::string &path, const Proof &proof);
Result<Proof, int> load_proof(const std::string &path);

int save_public_input(const std::string &path, const PublicInput &input);
Result<PublicInput, int> load_public_input(const std::string &path);

int save_calldata(const std::string &path, const Proof &proof, const PublicInput &input);
Result<Calldata, int> load_calldata(const std::string &path);
