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

#include "hash-algorithm.h"
#include "cryptopp-hasher.h"
#include "fnv-1a-64-hasher.h"

#include <stdexcept>
#include <string>

/// \file
/// \brief Hash algorithm selection implementation.

namespace merkle_root {

template <typename H>
static std::vector<unsigned char> get_root_hash_with(const block_sequence &blocks,
    const root_calculator_config &config) {
    const root_calculator<H> calculator{config};
    const auto root = calculator.get_root_hash(blocks);
    return {root.begin(), root.end()};
}

hash_algorithm parse_hash_algorithm(std::string_view name) {
    for (auto alg : hash_algorithms) {
        if (name == get_hash_algorithm_name(alg)) {
            return alg;
        }
    }
    throw std::invalid_argument{"unknown hash algorithm '" + std::string{name} + "'"};
}

const char *get_hash_algorithm_name(hash_algorithm alg) {
    switch (alg) {
        case hash_algorithm::keccak_256:
            return "keccak-256";
        case hash_algorithm::sha_256:
            return "sha-256";
        case hash_algorithm::fnv_1a_64:
            return "fnv-1a-64";
    }
    throw std::invalid_argument{"invalid hash algorithm"};
}

size_t get_hash_size(hash_algorithm alg) {
    switch (alg) {
        case hash_algorithm::keccak_256:
            return cryptopp_keccak_256_hasher::hash_size;
        case hash_algorithm::sha_256:
            return cryptopp_sha_256_hasher::hash_size;
        case hash_algorithm::fnv_1a_64:
            return fnv_1a_64_hasher::hash_size;
    }
    throw std::invalid_argument{"invalid hash algorithm"};
}

std::vector<unsigned char> get_root_hash(hash_algorithm alg, const block_sequence &blocks,
    const root_calculator_config &config) {
    switch (alg) {
        case hash_algorithm::keccak_256:
            return get_root_hash_with<cryptopp_keccak_256_hasher>(blocks, config);
        case hash_algorithm::sha_256:
            return get_root_hash_with<cryptopp_sha_256_hasher>(blocks, config);
        case hash_algorithm::fnv_1a_64:
            return get_root_hash_with<fnv_1a_64_hasher>(blocks, config);
    }
    throw std::invalid_argument{"invalid hash algorithm"};
}

} // namespace merkle_root
