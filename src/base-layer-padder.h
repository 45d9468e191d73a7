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

#ifndef BASE_LAYER_PADDER_H
#define BASE_LAYER_PADDER_H

#include <cstddef>
#include <string_view>

#include "block-sequence.h"

/// \file
/// \brief Padding of the base layer to a power-of-two number of blocks.

namespace merkle_root {

/// \brief Checks if a count is a power of two
/// \param n Count to check
/// \returns True if \p n is 1, 2, 4, 8, ... (0 is not a power of two)
constexpr bool is_power_of_2(size_t n) noexcept {
    return n != 0 && (n & (n - 1)) == 0;
}

/// \brief Returns the smallest power of two greater than or equal to a count
/// \param n Count, must be at least 1
/// \throws std::out_of_range if \p n is 0
/// \throws std::overflow_error if the result does not fit in size_t
size_t get_next_power_of_2(size_t n);

/// \brief Pads a block sequence in place with copies of a filler block
/// \param blocks Blocks to pad. On return, holds the original blocks followed
/// by as many fillers as needed to reach the next power of two.
/// \param filler Filler block appended at the end
/// \throws empty_input_error if \p blocks is empty
void pad_base_layer(block_sequence &blocks, std::string_view filler);

/// \brief Returns a padded copy of a block sequence
/// \param blocks Blocks to pad
/// \param filler Filler block appended at the end
/// \returns Copy of \p blocks padded as by pad_base_layer()
/// \throws empty_input_error if \p blocks is empty
block_sequence get_padded_base_layer(const block_sequence &blocks, std::string_view filler);

} // namespace merkle_root

#endif
