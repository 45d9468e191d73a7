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
#include <string>

#include "cryptopp-hasher.h"
#include "protobuf-util.h"

namespace merkle_root {

TEST_CASE("Proto hash conversion") {
    cryptopp_keccak_256_hasher h;
    const auto hash = get_hash(h, std::string{"fox"});

    MerkleRoot::Hash proto_hash;
    set_proto_hash(hash, &proto_hash);
    CHECK(proto_hash.data().size() == 32);
    CHECK(get_proto_hash<32>(proto_hash) == hash);
    CHECK(get_proto_hash(proto_hash) == std::vector<unsigned char>(hash.begin(), hash.end()));
    CHECK_THROWS_AS(get_proto_hash<8>(proto_hash), std::invalid_argument);
}

TEST_CASE("Proto block sequence conversion") {
    const block_sequence blocks{"The", "", std::string("\0\xff", 2), "dog"};

    MerkleRoot::BlockSequence proto_blocks;
    set_proto_block_sequence(blocks, &proto_blocks);
    REQUIRE(proto_blocks.blocks_size() == 4);
    CHECK(proto_blocks.blocks(2).size() == 2);

    std::string wire;
    REQUIRE(proto_blocks.SerializeToString(&wire));
    MerkleRoot::BlockSequence parsed;
    REQUIRE(parsed.ParseFromString(wire));
    CHECK(get_proto_block_sequence(parsed) == blocks);
}

TEST_CASE("Proto root report") {
    const block_sequence blocks{"The", "quick", "brown", "fox", "jumps", "over", "the", "lazy", "dog"};
    const auto root = get_root_hash(hash_algorithm::sha_256, blocks);

    MerkleRoot::RootReport report;
    set_proto_root_report(hash_algorithm::sha_256, blocks.size(), root, &report);
    CHECK(report.hash_algorithm() == "sha-256");
    CHECK(report.block_count() == 9);
    CHECK(report.leaf_count() == 16);
    CHECK(get_proto_hash(report.root_hash()) == root);

    MerkleRoot::RootReport mismatched;
    CHECK_THROWS_AS(set_proto_root_report(hash_algorithm::fnv_1a_64, blocks.size(), root, &mismatched),
        std::invalid_argument);
}

} // namespace merkle_root
