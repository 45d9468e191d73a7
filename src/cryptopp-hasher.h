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

#ifndef CRYPTOPP_HASHER_H
#define CRYPTOPP_HASHER_H

#include "i-hasher.h"
#include <cryptopp/keccak.h>
#include <cryptopp/sha.h>
#include <type_traits>

/// \file
/// \brief Hashers backed by Crypto++ hash transformations

namespace merkle_root {

/// \brief Adapts a Crypto++ hash transformation to the hasher interface
/// \tparam HASH Crypto++ class exposing DIGESTSIZE, Restart(), Update() and Final()
template <typename HASH>
class cryptopp_hasher final : public i_hasher<cryptopp_hasher<HASH>, std::integral_constant<int, HASH::DIGESTSIZE>> {

    using base_type = i_hasher<cryptopp_hasher<HASH>, std::integral_constant<int, HASH::DIGESTSIZE>>;

    HASH m_hash{};

    friend base_type;

    void do_begin(void) {
        return m_hash.Restart();
    }

    void do_add_data(const unsigned char *data, size_t length) {
        return m_hash.Update(data, length);
    }

    void do_end(typename base_type::hash_type &hash) {
        return m_hash.Final(hash.data());
    }

public:
    /// \brief Default constructor
    cryptopp_hasher(void) = default;

    /// \brief Default destructor
    ~cryptopp_hasher(void) = default;

    /// \brief No copy constructor
    cryptopp_hasher(const cryptopp_hasher &) = delete;
    /// \brief No move constructor
    cryptopp_hasher(cryptopp_hasher &&) = delete;
    /// \brief No copy assignment
    cryptopp_hasher &operator=(const cryptopp_hasher &) = delete;
    /// \brief No move assignment
    cryptopp_hasher &operator=(cryptopp_hasher &&) = delete;
};

/// \brief Keccak-256 with the original Keccak padding (not SHA3-256)
using cryptopp_keccak_256_hasher = cryptopp_hasher<CryptoPP::Keccak_256>;

/// \brief SHA-256
using cryptopp_sha_256_hasher = cryptopp_hasher<CryptoPP::SHA256>;

} // namespace merkle_root

#endif
