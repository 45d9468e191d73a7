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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "cryptopp-hasher.h"
#include "fnv-1a-64-hasher.h"
#include "hex-util.h"

namespace merkle_root {

using namespace std::string_view_literals;

TEST_CASE("Keccak-256 known answers") {
    cryptopp_keccak_256_hasher h;
    CHECK(cryptopp_keccak_256_hasher::hash_size == 32);
    CHECK(to_hex(get_hash(h, ""sv)) == "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
    CHECK(to_hex(get_hash(h, "abc"sv)) == "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST_CASE("SHA-256 known answers") {
    cryptopp_sha_256_hasher h;
    CHECK(cryptopp_sha_256_hasher::hash_size == 32);
    CHECK(to_hex(get_hash(h, ""sv)) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(to_hex(get_hash(h, "abc"sv)) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("FNV-1a 64 known answers") {
    fnv_1a_64_hasher h;
    CHECK(fnv_1a_64_hasher::hash_size == 8);
    // digests are little-endian: 0xcbf29ce484222325 is the offset basis
    CHECK(to_hex(get_hash(h, ""sv)) == "25232284e49cf2cb");
    CHECK(to_hex(get_hash(h, "a"sv)) == "8cec01864cdc63af");
    CHECK(to_hex(get_hash(h, "abc"sv)) == "4b57410519a21fe7");
}

TEST_CASE("Hashing is deterministic across hasher reuse") {
    fnv_1a_64_hasher h;
    const auto first = get_hash(h, "quick"sv);
    get_hash(h, "brown"sv);
    CHECK(get_hash(h, "quick"sv) == first);

    cryptopp_keccak_256_hasher k;
    const auto kfirst = get_hash(k, "quick"sv);
    get_hash(k, "brown"sv);
    CHECK(get_hash(k, "quick"sv) == kfirst);
}

TEST_CASE("Byte-serializable values") {
    cryptopp_sha_256_hasher h;

    SECTION("strings, views and byte vectors hash their bytes") {
        const std::string s{"fox"};
        const std::vector<unsigned char> v{'f', 'o', 'x'};
        CHECK(get_hash(h, s) == get_hash(h, "fox"sv));
        CHECK(get_hash(h, v) == get_hash(h, "fox"sv));
    }

    SECTION("integers hash their little-endian bytes") {
        CHECK(get_hash(h, uint32_t{0x64636261}) == get_hash(h, "abcd"sv));
        CHECK(get_hash(h, uint8_t{'z'}) == get_hash(h, "z"sv));
        CHECK(get_hash(h, UINT64_C(0x0102030405060708)) == get_hash(h, "\x08\x07\x06\x05\x04\x03\x02\x01"sv));
    }

    SECTION("raw byte ranges") {
        const unsigned char bytes[] = {'a', 'b', 'c'};
        cryptopp_sha_256_hasher::hash_type result;
        get_hash(h, bytes, sizeof(bytes), result);
        CHECK(result == get_hash(h, "abc"sv));
    }
}

TEST_CASE("Concatenated hash") {
    fnv_1a_64_hasher h;
    const auto a = get_hash(h, "The"sv);
    const auto b = get_hash(h, "quick"sv);

    SECTION("hashes left bytes followed by right bytes") {
        std::string concat(a.begin(), a.end());
        concat.append(b.begin(), b.end());
        CHECK(get_concat_hash(h, a, b) == get_hash(h, concat));
    }

    SECTION("is sensitive to order") {
        CHECK(get_concat_hash(h, a, b) != get_concat_hash(h, b, a));
    }

    SECTION("result may alias an operand") {
        const auto expected = get_concat_hash(h, a, b);
        auto right = b;
        get_concat_hash(h, a, right, right);
        CHECK(right == expected);
    }
}

} // namespace merkle_root
