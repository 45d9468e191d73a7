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

#include "protobuf-util.h"
#include "base-layer-padder.h"

namespace merkle_root {

std::vector<unsigned char> get_proto_hash(const MerkleRoot::Hash &proto_hash) {
    const auto &data = proto_hash.data();
    return {data.begin(), data.end()};
}

block_sequence get_proto_block_sequence(const MerkleRoot::BlockSequence &proto_blocks) {
    block_sequence blocks;
    blocks.reserve(static_cast<size_t>(proto_blocks.blocks_size()));
    for (const auto &block : proto_blocks.blocks()) {
        blocks.push_back(block);
    }
    return blocks;
}

void set_proto_block_sequence(const block_sequence &blocks, MerkleRoot::BlockSequence *proto_blocks) {
    for (const auto &block : blocks) {
        proto_blocks->add_blocks(block);
    }
}

void set_proto_root_report(hash_algorithm alg, uint64_t block_count, const std::vector<unsigned char> &root_hash,
    MerkleRoot::RootReport *proto_report) {
    if (root_hash.size() != get_hash_size(alg)) {
        throw std::invalid_argument("root hash size does not match hash algorithm");
    }
    proto_report->set_hash_algorithm(get_hash_algorithm_name(alg));
    proto_report->set_block_count(block_count);
    proto_report->set_leaf_count(block_count == 0 ? 0 : get_next_power_of_2(block_count));
    set_proto_hash(root_hash, proto_report->mutable_root_hash());
}

} // namespace merkle_root
