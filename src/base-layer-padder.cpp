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

#include "base-layer-padder.h"
#include "merkle-root-errors.h"

#include <limits>
#include <stdexcept>

/// \file
/// \brief Base layer padder implementation.

namespace merkle_root {

size_t get_next_power_of_2(size_t n) {
    if (n == 0) {
        throw std::out_of_range{"no power of two precedes an empty layer"};
    }
    constexpr size_t max_power_of_2 = size_t{1} << (std::numeric_limits<size_t>::digits - 1);
    if (n > max_power_of_2) {
        throw std::overflow_error{"too many blocks for a balanced tree"};
    }
    size_t p = 1;
    while (p < n) {
        p <<= 1;
    }
    return p;
}

void pad_base_layer(block_sequence &blocks, std::string_view filler) {
    if (blocks.empty()) {
        throw empty_input_error{"block sequence is empty"};
    }
    const size_t padded_size = get_next_power_of_2(blocks.size());
    blocks.reserve(padded_size);
    while (blocks.size() < padded_size) {
        blocks.emplace_back(filler);
    }
}

block_sequence get_padded_base_layer(const block_sequence &blocks, std::string_view filler) {
    block_sequence padded{blocks};
    pad_base_layer(padded, filler);
    return padded;
}

} // namespace merkle_root
