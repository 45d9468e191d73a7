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

#include "block-sequence.h"

/// \file
/// \brief Block sequence tokenization implementation.

namespace merkle_root {

/// \brief Returns the length of the UTF-8 encoded white space character at a position, or 0 if there is none
/// \details Recognizes every code point with the Unicode White_Space property.
static size_t get_space_length(std::string_view text, size_t i) {
    const auto byte = [&](size_t k) { return static_cast<unsigned char>(text[i + k]); };
    const size_t left = text.size() - i;
    const unsigned char c = byte(0);
    if (c == ' ' || (c >= '\t' && c <= '\r')) {
        return 1;
    }
    if (c == 0xc2 && left >= 2) {
        // U+0085 NEL, U+00A0 NO-BREAK SPACE
        return (byte(1) == 0x85 || byte(1) == 0xa0) ? 2 : 0;
    }
    if (left < 3) {
        return 0;
    }
    if (c == 0xe1) {
        // U+1680 OGHAM SPACE MARK
        return (byte(1) == 0x9a && byte(2) == 0x80) ? 3 : 0;
    }
    if (c == 0xe2 && byte(1) == 0x80) {
        // U+2000..U+200A, U+2028, U+2029, U+202F
        const unsigned char d = byte(2);
        return ((d >= 0x80 && d <= 0x8a) || d == 0xa8 || d == 0xa9 || d == 0xaf) ? 3 : 0;
    }
    if (c == 0xe2 && byte(1) == 0x81) {
        // U+205F MEDIUM MATHEMATICAL SPACE
        return byte(2) == 0x9f ? 3 : 0;
    }
    if (c == 0xe3) {
        // U+3000 IDEOGRAPHIC SPACE
        return (byte(1) == 0x80 && byte(2) == 0x80) ? 3 : 0;
    }
    return 0;
}

block_sequence tokenize_whitespace(std::string_view text) {
    block_sequence blocks;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size()) {
            const size_t n = get_space_length(text, i);
            if (n == 0) {
                break;
            }
            i += n;
        }
        const size_t start = i;
        while (i < text.size() && get_space_length(text, i) == 0) {
            ++i;
        }
        if (i > start) {
            blocks.emplace_back(text.substr(start, i - start));
        }
    }
    return blocks;
}

} // namespace merkle_root
