// Copyright Cartesi and individual authors (see AUTHORS)
// SPDX-License-Identifier: Apache-2.0
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#ifndef HEX_UTIL_H
#define HEX_UTIL_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/// \file
/// \brief Hexadecimal encoding of hashes.

namespace merkle_root {

/// \brief Encodes bytes as lowercase hexadecimal, two digits per byte
std::string to_hex(const unsigned char *data, size_t length);

/// \brief Encodes a hash (or any contiguous range of bytes) as lowercase hexadecimal
template <typename T>
std::string to_hex(const T &bytes) {
    return to_hex(reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size());
}

/// \brief Decodes hexadecimal text, with or without a leading "0x"
/// \throws std::invalid_argument if \p hex has an odd number of digits or a non-hex character
std::vector<unsigned char> from_hex(std::string_view hex);

} // namespace merkle_root

#endif
