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

#ifndef I_HASHER_H
#define I_HASHER_H

/// \file
/// \brief Hasher interface

#include <array>
#include <climits>
#include <cstddef>

#include "meta.h"

namespace merkle_root {

/// \brief Hasher interface.
/// \tparam DERIVED Derived class implementing the interface. (An example of CRTP.)
/// \tparam HASH_SIZE Size of hash, in bytes. This is the digest width of every node in the tree.
template <typename DERIVED, typename HASH_SIZE>
class i_hasher { // CRTP

    /// \brief Returns object cast as the derived class
    DERIVED &derived(void) {
        return *static_cast<DERIVED *>(this);
    }

    /// \brief Returns object cast as the derived class
    const DERIVED &derived(void) const {
        return *static_cast<const DERIVED *>(this);
    }

public:
    constexpr static size_t hash_size = HASH_SIZE::value;

    using hash_type = std::array<unsigned char, hash_size>;

    void begin(void) {
        return derived().do_begin();
    }

    void add_data(const unsigned char *data, size_t length) {
        return derived().do_add_data(data, length);
    }

    void end(hash_type &hash) {
        return derived().do_end(hash);
    }
};

template <typename DERIVED>
using is_an_i_hasher =
    std::integral_constant<bool, is_template_base_of<i_hasher, typename remove_cvref<DERIVED>::type>::value>;

/// \brief Computes the hash of a byte range
/// \tparam H Hasher class
/// \param h Hasher object
/// \param data Pointer to first byte
/// \param length Number of bytes
/// \param result Receives the hash of the range
template <typename H>
inline static void get_hash(H &h, const unsigned char *data, size_t length, typename H::hash_type &result) {
    static_assert(is_an_i_hasher<H>::value, "not an i_hasher");
    h.begin();
    h.add_data(data, length);
    h.end(result);
}

/// \brief Computes the hash of a byte-serializable value
/// \tparam H Hasher class
/// \tparam T Value type. Either a contiguous range of single-byte elements,
/// or an integral type, which is serialized in little-endian order.
/// \param h Hasher object
/// \param value Value to hash
/// \return The hash of the serialized value
template <typename H, typename T>
inline static typename H::hash_type get_hash(H &h, const T &value) {
    static_assert(is_an_i_hasher<H>::value, "not an i_hasher");
    static_assert(is_byte_range<T>::value || is_little_endian_serializable<T>::value, "value is not byte-serializable");
    typename H::hash_type result;
    if constexpr (is_byte_range<T>::value) {
        get_hash(h, reinterpret_cast<const unsigned char *>(value.data()), value.size(), result);
    } else {
        using U = std::make_unsigned_t<typename remove_cvref<T>::type>;
        auto u = static_cast<U>(value);
        std::array<unsigned char, sizeof(U)> bytes{};
        for (auto &b : bytes) {
            b = static_cast<unsigned char>(u & UCHAR_MAX);
            u = static_cast<U>(u >> CHAR_BIT);
        }
        get_hash(h, bytes.data(), bytes.size(), result);
    }
    return result;
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \param result Receives the hash of the concatenation
/// \details Hashes bytes(left) || bytes(right), in that order. The order matters.
template <typename H>
inline static void get_concat_hash(H &h, const typename H::hash_type &left, const typename H::hash_type &right,
    typename H::hash_type &result) {
    static_assert(is_an_i_hasher<H>::value, "not an i_hasher");
    h.begin();
    h.add_data(left.data(), left.size());
    h.add_data(right.data(), right.size());
    h.end(result);
}

/// \brief Computes the hash of concatenated hashes
/// \tparam H Hasher class
/// \param h Hasher object
/// \param left Left hash to concatenate
/// \param right Right hash to concatenate
/// \return The hash of the concatenation
template <typename H>
inline static typename H::hash_type get_concat_hash(H &h, const typename H::hash_type &left,
    const typename H::hash_type &right) {
    typename H::hash_type result;
    get_concat_hash(h, left, right, result);
    return result;
}

} // namespace merkle_root

#endif
