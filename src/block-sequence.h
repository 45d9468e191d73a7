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

#ifndef BLOCK_SEQUENCE_H
#define BLOCK_SEQUENCE_H

#include <string>
#include <string_view>
#include <vector>

/// \file
/// \brief Blocks and block sequence tokenization.

namespace merkle_root {

/// \brief Opaque block of bytes at the base of the tree
using block_type = std::string;

/// \brief Ordered sequence of blocks
using block_sequence = std::vector<block_type>;

/// \brief Splits UTF-8 text into whitespace-delimited blocks
/// \details Separators are the ASCII white space characters (tab through carriage return, space) and the
/// UTF-8 encodings of the other Unicode White_Space code points (U+0085, U+00A0, U+1680, U+2000..U+200A,
/// U+2028, U+2029, U+202F, U+205F and U+3000). Other bytes, including invalid UTF-8, stay inside blocks.
/// \param text Text to split
/// \returns Blocks in the order they appear in \p text. Empty when \p text has no words.
block_sequence tokenize_whitespace(std::string_view text);

} // namespace merkle_root

#endif
