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

#ifndef FNV_1A_64_HASHER_H
#define FNV_1A_64_HASHER_H

#include "i-hasher.h"
#include <cstdint>
#include <type_traits>

/// \file
/// \brief 64-bit FNV-1a hasher

namespace merkle_root {

/// \brief Computes 64-bit FNV-1a hashes
/// \details The digest is stored in little-endian byte order.
/// \warning FNV-1a is not a cryptographic hash. It is neither collision- nor preimage-resistant,
/// and roots computed with it only illustrate the tree construction.
class fnv_1a_64_hasher final : public i_hasher<fnv_1a_64_hasher, std::integral_constant<int, sizeof(uint64_t)>> {

    static constexpr uint64_t offset_basis = UINT64_C(0xcbf29ce484222325);
    static constexpr uint64_t prime = UINT64_C(0x100000001b3);

    uint64_t m_state{offset_basis};

    friend i_hasher<fnv_1a_64_hasher, std::integral_constant<int, sizeof(uint64_t)>>;

    void do_begin(void) {
        m_state = offset_basis;
    }

    void do_add_data(const unsigned char *data, size_t length) {
        for (size_t i = 0; i < length; ++i) {
            m_state ^= data[i];
            m_state *= prime;
        }
    }

    void do_end(hash_type &hash) {
        for (size_t i = 0; i < hash.size(); ++i) {
            hash[i] = static_cast<unsigned char>(m_state >> (8 * i));
        }
    }

public:
    /// \brief Default constructor
    fnv_1a_64_hasher(void) = default;

    /// \brief Default destructor
    ~fnv_1a_64_hasher(void) = default;

    /// \brief No copy constructor
    fnv_1a_64_hasher(const fnv_1a_64_hasher &) = delete;
    /// \brief No move constructor
    fnv_1a_64_hasher(fnv_1a_64_hasher &&) = delete;
    /// \brief No copy assignment
    fnv_1a_64_hasher &operator=(const fnv_1a_64_hasher &) = delete;
    /// \brief No move assignment
    fnv_1a_64_hasher &operator=(fnv_1a_64_hasher &&) = delete;
};

} // namespace merkle_root

#endif
