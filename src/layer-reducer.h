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

#ifndef LAYER_REDUCER_H
#define LAYER_REDUCER_H

#include <string>
#include <vector>

#include "i-hasher.h"
#include "merkle-root-errors.h"

/// \file
/// \brief Reduction of a tree layer into the layer above it.

namespace merkle_root {

/// \brief Layer of hashes at one depth of the tree, in left-to-right order
/// \tparam H Hasher class
template <typename H>
using layer_type = std::vector<typename H::hash_type>;

/// \brief Computes the layer above a given layer
/// \tparam H Hasher class
/// \param h Hasher object
/// \param layer Layer to reduce. Its size must be even and non-zero.
/// \returns Layer with half as many hashes. Entry i is the concatenated hash of
/// entries 2i (left) and 2i+1 (right) of \p layer.
/// \throws malformed_layer_error if \p layer cannot be paired up
template <typename H>
layer_type<H> reduce_layer(H &h, const layer_type<H> &layer) {
    static_assert(is_an_i_hasher<H>::value, "not an i_hasher");
    if (layer.empty() || (layer.size() & 1) != 0) {
        throw malformed_layer_error{"cannot pair up a layer with " + std::to_string(layer.size()) + " hashes"};
    }
    layer_type<H> parent(layer.size() / 2);
    for (size_t i = 0; i < parent.size(); ++i) {
        get_concat_hash(h, layer[2 * i], layer[2 * i + 1], parent[i]);
    }
    return parent;
}

} // namespace merkle_root

#endif
