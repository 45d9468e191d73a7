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

#ifndef ROOT_CALCULATOR_H
#define ROOT_CALCULATOR_H

#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "base-layer-padder.h"
#include "block-sequence.h"
#include "hex-util.h"
#include "i-hasher.h"
#include "layer-reducer.h"

/// \file
/// \brief Merkle tree root calculation.

namespace merkle_root {

/// \brief Root calculator configuration
struct root_calculator_config {
    block_type filler{}; ///< Block appended to pad the base layer (empty by default)
};

/// \brief Computes the root hash of a balanced Merkle tree over a block sequence
/// \tparam H Hasher class used for leaves and inner nodes
/// \details The tree is never stored. The base layer is padded with filler blocks
/// to a power of two, each block is hashed into a leaf, and layers are reduced
/// pairwise, left to right, until a single hash remains.
template <typename H>
class root_calculator final {
    static_assert(is_an_i_hasher<H>::value, "not an i_hasher");

    root_calculator_config m_config;

public:
    using hasher_type = H;

    using hash_type = typename hasher_type::hash_type;

    using layer_type = merkle_root::layer_type<hasher_type>;

    /// \brief Constructor
    /// \param config Configuration
    explicit root_calculator(root_calculator_config config = {}) : m_config{std::move(config)} {}

    /// \brief Returns the configuration
    const root_calculator_config &get_config(void) const {
        return m_config;
    }

    /// \brief Pads blocks with the configured filler
    /// \throws empty_input_error if \p blocks is empty
    block_sequence get_padded_blocks(const block_sequence &blocks) const {
        return get_padded_base_layer(blocks, m_config.filler);
    }

    /// \brief Hashes each block of an already padded sequence into a leaf
    /// \param padded Blocks whose count is a power of two
    /// \returns Leaf layer, one hash per block, in the same order
    /// \throws malformed_layer_error if the number of blocks is not a power of two
    layer_type get_leaf_layer(const block_sequence &padded) const {
        if (!is_power_of_2(padded.size())) {
            throw malformed_layer_error{"base layer with " + std::to_string(padded.size()) + " blocks is not padded"};
        }
        hasher_type h;
        layer_type leaves;
        leaves.reserve(padded.size());
        for (const auto &block : padded) {
            leaves.push_back(get_hash(h, block));
        }
        return leaves;
    }

    /// \brief Computes the root hash of a block sequence
    /// \param blocks Blocks in tree order
    /// \returns Root hash. With a single block, this is the hash of that block.
    /// \throws empty_input_error if \p blocks is empty
    hash_type get_root_hash(const block_sequence &blocks) const {
        const auto padded = get_padded_blocks(blocks);
        spdlog::debug("padded {} blocks to {}", blocks.size(), padded.size());
        auto layer = get_leaf_layer(padded);
        hasher_type h;
        int depth = 0;
        while (layer.size() > 1) {
            layer = reduce_layer(h, layer);
            ++depth;
            spdlog::trace("reduced to layer of {} hashes", layer.size());
        }
        if (spdlog::should_log(spdlog::level::debug)) {
            spdlog::debug("root {} at depth {}", to_hex(layer.front()), depth);
        }
        return layer.front();
    }

    /// \brief Computes the root hash of text split into whitespace-delimited blocks
    /// \param text Text to tokenize
    /// \throws empty_input_error if \p text contains no words
    hash_type get_root_hash(std::string_view text) const {
        return get_root_hash(tokenize_whitespace(text));
    }
};

} // namespace merkle_root

#endif
