//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

namespace vigil {

//! Overloads pattern, combines several lambdas into a single visitor for a
//! `std::variant`.
/*!
 Each alternative gets its own lambda. Omitting the generic `auto` lambda turns
 a newly added alternative without a handler into a compile time error, which
 is what the modifier rules rely on.

 <b>Example usage:</b>
 \code
 auto IsBound(const ModifierSettings& settings) -> bool {
    return std::visit(
        Overloads {
            [](const SurfaceDeformModifier& m) { return m.is_bound; },
            [](const auto&) { return true; },
        },
        settings);
 }
 \endcode
*/
template <class... Ts> struct Overloads : Ts... {
  using Ts::operator()...;
};

} // namespace vigil
