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

#ifndef HASH_ALGORITHM_H
#define HASH_ALGORITHM_H

#include <array>
#include <cstddef>
#include <string_view>
#include <vector>

#include "block-sequence.h"
#include "root-calculator.h"

/// \file
/// \brief Run-time selection of the hasher used to compute roots.

namespace merkle_root {

/// \brief Hash algorithms available at run time
enum class hash_algorithm {
    keccak_256, ///< Keccak-256, 32-byte digests (default)
    sha_256,    ///< SHA-256, 32-byte digests
    fnv_1a_64,  ///< FNV-1a, 8-byte digests, not cryptographic
};

/// \brief Every hash algorithm, default first
inline constexpr std::array<hash_algorithm, 3> hash_algorithms{
    hash_algorithm::keccak_256, hash_algorithm::sha_256, hash_algorithm::fnv_1a_64};

/// \brief Parses a hash algorithm name ("keccak-256", "sha-256" or "fnv-1a-64")
/// \throws std::invalid_argument if \p name is unknown
hash_algorithm parse_hash_algorithm(std::string_view name);

/// \brief Returns the name of a hash algorithm, as accepted by parse_hash_algorithm()
const char *get_hash_algorithm_name(hash_algorithm alg);

/// \brief Returns the digest size of a hash algorithm, in bytes
size_t get_hash_size(hash_algorithm alg);

/// \brief Computes the root hash of a block sequence with the selected algorithm
/// \param alg Hash algorithm
/// \param blocks Blocks in tree order
/// \param config Root calculator configuration
/// \returns Root hash bytes, get_hash_size(alg) of them
/// \throws empty_input_error if \p blocks is empty
std::vector<unsigned char> get_root_hash(hash_algorithm alg, const block_sequence &blocks,
    const root_calculator_config &config = {});

} // namespace merkle_root

#endif
