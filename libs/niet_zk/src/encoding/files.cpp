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


#include <fstream>
#include <iterator>
#include "codes.h"
#include "files.h"


int save_bytes(const std::string &path, const byte* data, size_t len) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) return IO_ERR;
    out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    out.close();
    return out ? OK : IO_ERR;
}

Result<std::vector<byte>, int> load_bytes(const std::string &path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return fail(IO_ERR);

    std::vector<byte> data(
        (std::istreambuf_iterator<char>(in)),
        std::istreambuf_iterator<char>()
    );
    if (in.bad()) return fail(IO_ERR);
    return data;
}

template <typename T, typename Decode>
static Result<T, int> load_with(const std::string &path, Decode decode) {
    auto data = load_bytes(path);
    if (data.is_err()) return fail(data.unwrap_err());
    auto &bytes = data.unwrap();
    return decode(bytes.data(), bytes.size());
}

int save_proving_key(const std::string &path, const ProvingKey &pk) {
    PkBytes bytes = encode_proving_key(pk);
    return save_bytes(path, bytes.data(), bytes.size());
}

Result<ProvingKey, int> load_proving_key(const std::string &path) {
    return load_with<ProvingKey>(path, decode_proving_key);
}

int save_verifying_key(const std::string &path, const VerifyingKey &vk) {
    VkBytes bytes = encode_verifying_key(vk);
    return save_bytes(path, bytes.data(), bytes.size());
}

Result<VerifyingKey, int> load_verifying_key(const std::string &path) {
    return load_with<VerifyingKey>(path, decode_verifying_key);
}

int save_proof(const std::string &path, const Proof &proof) {
    ProofBytes bytes = encode_proof(proof);
    return save_bytes(path, bytes.data(), bytes.size());
}

Result<Proof, int> load_proof(const std::string &path) {
    return load_with<Proof>(path, decode_proof);
}

int save_public_input(const std::string &path, const PublicInput &input) {
    auto bytes = encode_public_input(input);
    if (bytes.is_err()) return bytes.unwrap_err();
    return save_bytes(path, bytes.unwrap().data(), INPUT_BYTES);
}

Result<PublicInput, int> load_public_input(const std::string &path) {
    return load_with<PublicInput>(path, decode_public_input);
}

int save_calldata(const std::string &path, const Proof &proof, const PublicInput &input) {
    auto bytes = encode_calldata(proof, input);
    if (bytes.is_err()) return bytes.unwrap_err();
    return save_bytes(path, bytes.unwrap().data(), CALLDATA_BYTES);
}

Result<Calldata, int> load_calldata(const std::string &path) {
    return load_with<Calldata>(path, decode_calldata);
}
