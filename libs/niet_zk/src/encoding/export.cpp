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


#include <iomanip>
#include <sstream>
#include "export.h"
#include "serialize.h"

const size_t BYTES_PER_LINE = 12;

std::string export_verifying_key_cpp(
    const VerifyingKey &vk,
    const std::string &symbol
) {
    VkBytes bytes = encode_verifying_key(vk);

    std::ostringstream out;
    out << "// Generated by niet_export_vk. Do not edit.\n"
        << "#include <cstddef>\n"
        << "#include <cstdint>\n\n"
        << "extern \"C\" const uint8_t " << symbol << "[" << VK_BYTES << "] = {";

    for (size_t i{}; i < bytes.size(); i++) {
        if (i % BYTES_PER_LINE == 0) out << "\n   ";
        out << " 0x" << std::hex << std::setw(2) << std::setfill('0')
            << static_cast<int>(bytes[i]) << std::dec << ",";
    }

    out << "\n};\n\n"
        << "extern \"C\" const size_t " << symbol << "_SIZE = " << VK_BYTES << ";\n";
    return out.str();
}
