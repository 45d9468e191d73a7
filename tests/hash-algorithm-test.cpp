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

#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include "cryptopp-hasher.h"
#include "fnv-1a-64-hasher.h"
#include "hash-algorithm.h"
#include "hex-util.h"

namespace merkle_root {

TEST_CASE("Hash algorithm names") {
    CHECK(hash_algorithms.front() == hash_algorithm::keccak_256);
    for (auto alg : hash_algorithms) {
        CHECK(parse_hash_algorithm(get_hash_algorithm_name(alg)) == alg);
    }
    CHECK(parse_hash_algorithm("keccak-256") == hash_algorithm::keccak_256);
    CHECK_THROWS_AS(parse_hash_algorithm("md5"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hash_algorithm(""), std::invalid_argument);
    CHECK_THROWS_AS(parse_hash_algorithm("Keccak-256"), std::invalid_argument);
    CHECK_THROWS_AS(parse_hash_algorithm("keccak-256 "), std::invalid_argument);
}

TEST_CASE("Hash sizes") {
    for (auto alg : hash_algorithms) {
        CHECK(get_root_hash(alg, block_sequence{"x"}).size() == get_hash_size(alg));
    }
    CHECK(get_hash_size(hash_algorithm::keccak_256) == 32);
    CHECK(get_hash_size(hash_algorithm::sha_256) == 32);
    CHECK(get_hash_size(hash_algorithm::fnv_1a_64) == 8);
}

TEST_CASE("Run-time selection agrees with the hasher types") {
    const block_sequence blocks{"My", "name", "is", "Jeff"};

    const auto keccak_root = root_calculator<cryptopp_keccak_256_hasher>{}.get_root_hash(blocks);
    CHECK(get_root_hash(hash_algorithm::keccak_256, blocks) ==
        std::vector<unsigned char>(keccak_root.begin(), keccak_root.end()));

    const auto sha_root = root_calculator<cryptopp_sha_256_hasher>{}.get_root_hash(blocks);
    CHECK(get_root_hash(hash_algorithm::sha_256, blocks) == std::vector<unsigned char>(sha_root.begin(), sha_root.end()));

    CHECK(get_root_hash(hash_algorithm::fnv_1a_64, block_sequence{"a", "b"}) == from_hex("3e475878f9737841"));

    root_calculator_config config;
    config.filler = "-";
    const block_sequence fox{"The", "quick", "brown", "fox", "jumps", "over", "the", "lazy", "dog"};
    CHECK(get_root_hash(hash_algorithm::fnv_1a_64, fox) == from_hex("0x22515a97442afb23"));
    CHECK(get_root_hash(hash_algorithm::fnv_1a_64, fox, config) == from_hex("cfc6976f65f840a8"));

    CHECK(get_root_hash(hash_algorithm::keccak_256, blocks) != get_root_hash(hash_algorithm::sha_256, blocks));
    CHECK_THROWS_AS(get_root_hash(hash_algorithm::sha_256, block_sequence{}), empty_input_error);
}

} // namespace merkle_root
