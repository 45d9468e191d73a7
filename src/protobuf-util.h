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

#ifndef PROTOBUF_UTIL_H
#define PROTOBUF_UTIL_H

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wunused-parameter"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#pragma GCC diagnostic ignored "-Wdeprecated-copy"
#pragma GCC diagnostic ignored "-Wtype-limits"
#include "merkle-root.pb.h"
#pragma GCC diagnostic pop

#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "block-sequence.h"
#include "hash-algorithm.h"

namespace merkle_root {

/// \brief Converts proto Hash to C++ hash
/// \tparam N Expected hash size, in bytes
/// \param proto_hash Proto Hash to convert
/// \returns Converted C++ hash
/// \throws std::invalid_argument if the proto hash does not have exactly \p N bytes
template <size_t N>
std::array<unsigned char, N> get_proto_hash(const MerkleRoot::Hash &proto_hash) {
    std::array<unsigned char, N> hash;
    if (proto_hash.data().size() != hash.size()) {
        throw std::invalid_argument("invalid hash size");
    }
    memcpy(hash.data(), proto_hash.data().data(), proto_hash.data().size());
    return hash;
}

/// \brief Converts proto Hash to C++ hash bytes of any size
/// \param proto_hash Proto Hash to convert
/// \returns Hash bytes
std::vector<unsigned char> get_proto_hash(const MerkleRoot::Hash &proto_hash);

/// \brief Converts C++ hash to proto Hash
/// \param h C++ hash to convert (any contiguous range of bytes)
/// \param proto_h Pointer to proto Hash receiving result of conversion
template <typename T>
void set_proto_hash(const T &h, MerkleRoot::Hash *proto_h) {
    proto_h->set_data(std::string(reinterpret_cast<const char *>(h.data()), h.size()));
}

/// \brief Converts proto BlockSequence to C++ block sequence
/// \param proto_blocks Proto BlockSequence to convert
/// \returns Converted block sequence, in the same order
block_sequence get_proto_block_sequence(const MerkleRoot::BlockSequence &proto_blocks);

/// \brief Converts C++ block sequence to proto BlockSequence
/// \param blocks Block sequence to convert
/// \param proto_blocks Pointer to proto BlockSequence receiving result of conversion
void set_proto_block_sequence(const block_sequence &blocks, MerkleRoot::BlockSequence *proto_blocks);

/// \brief Fills a proto RootReport
/// \param alg Hash algorithm the root was computed with
/// \param block_count Number of blocks before padding
/// \param root_hash Root hash bytes
/// \param proto_report Pointer to proto RootReport receiving the report
/// \throws std::invalid_argument if \p root_hash size does not match \p alg
/// \details The leaf count is the padded block count.
void set_proto_root_report(hash_algorithm alg, uint64_t block_count, const std::vector<unsigned char> &root_hash,
    MerkleRoot::RootReport *proto_report);

} // namespace merkle_root

#endif
