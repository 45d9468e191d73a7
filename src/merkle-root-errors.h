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

#ifndef MERKLE_ROOT_ERRORS_H
#define MERKLE_ROOT_ERRORS_H

#include <stdexcept>

/// \file
/// \brief Exceptions thrown by the root calculation.

namespace merkle_root {

/// \brief Thrown when there are no blocks to build a tree from
class empty_input_error : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// \brief Thrown when a layer that cannot be reduced reaches the layer reducer
/// \details Means padding was skipped or is broken upstream.
class malformed_layer_error : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace merkle_root

#endif
