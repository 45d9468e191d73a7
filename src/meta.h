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

#ifndef META_H
#define META_H

#include <cstddef>
#include <type_traits>
#include <utility>

/// \file
/// \brief Meta-programming helper functions.

namespace merkle_root {

namespace detail {
template <template <typename...> class BASE, typename DERIVED>
struct is_template_base_of_helper {
    struct no {};
    struct yes {};
    no operator()(...);
    template <typename... T>
    yes operator()(const BASE<T...> &);
};

template <typename T, typename = void>
struct is_byte_range_helper : std::false_type {};

template <typename T>
struct is_byte_range_helper<T,
    std::void_t<decltype(std::declval<const T &>().data()), decltype(std::declval<const T &>().size())>> :
    std::integral_constant<bool,
        sizeof(*std::declval<const T &>().data()) == 1 &&
            std::is_trivially_copyable<std::remove_pointer_t<decltype(std::declval<const T &>().data())>>::value> {};
} // namespace detail

/// \class remove_cvref
/// \brief Provides a member typedef type with reference and topmost cv-qualifiers removed.
/// \note (This is directly available in C++20.)
template <typename T>
struct remove_cvref {
    using type = typename std::remove_reference<typename std::remove_cv<T>::type>::type;
};

/// \class is_template_base_of
/// \brief SFINAE test if class is derived from from a base template class.
/// \tparam BASE Base template.
/// \tparam DERIVED Derived class.
template <template <typename...> class BASE, typename DERIVED>
using is_template_base_of = std::integral_constant<bool,
    std::is_same<typename std::invoke_result<detail::is_template_base_of_helper<BASE, DERIVED>, const DERIVED &>::type,
        typename detail::is_template_base_of_helper<BASE, DERIVED>::yes>::value>;

/// \class is_byte_range
/// \brief Tests if \p T is a contiguous range of single-byte elements (exposes data() and size()).
/// \details std::string, std::string_view, std::vector<unsigned char> and std::array<unsigned char, N> qualify.
template <typename T>
using is_byte_range = detail::is_byte_range_helper<typename remove_cvref<T>::type>;

/// \class is_little_endian_serializable
/// \brief Tests if \p T is an integral value hashed through its little-endian byte representation.
template <typename T>
using is_little_endian_serializable = std::integral_constant<bool,
    std::is_integral<typename remove_cvref<T>::type>::value &&
        !std::is_same<typename remove_cvref<T>::type, bool>::value>;

} // namespace merkle_root

#endif
