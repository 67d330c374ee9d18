//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit {

//! Object names forming a cycle. The first name is repeated at the end.
using Chain = std::vector<std::string>;

//! Follows the parent references from \p start until a name repeats.
/*!
 \return the minimal cycle, from the first occurrence of the repeated name to
 its repetition, or std::nullopt when the walk reaches a root or an object
 that no longer exists. For A -> B -> C -> A started at B, the result is
 [B, C, A, B].

 \note \p start itself need not be on the cycle: an object whose ancestors
 loop reports the ancestors' cycle.
*/
VGL_AUD_NDAPI auto DetectParentChain(
  const scene::SceneStore& store, std::string_view start)
  -> std::optional<Chain>;

//! Depth-first search of the driver dependency graph from \p start.
/*!
 Edges go from an object to every object targeted by a driver variable on it.
 Self references are not edges, and targets that are not objects end their
 branch. Each branch works on its own copy of the visited set and path, so two
 unrelated branches reaching the same object do not make a cycle.

 \return the first cycle found, in the format of DetectParentChain(), or
 std::nullopt.
*/
VGL_AUD_NDAPI auto DetectDriverChain(
  const scene::SceneStore& store, std::string_view start)
  -> std::optional<Chain>;

//! Renders \p chain as `A → B → A`.
VGL_AUD_NDAPI auto FormatChain(const Chain& chain) -> std::string;

} // namespace vigil::audit
