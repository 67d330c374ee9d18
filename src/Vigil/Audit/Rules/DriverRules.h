//===----------------------------------------------------------------------===//
// Distributed under the 3-Clause BSD License. See accompanying file LICENSE or
// copy at https://opensource.org/licenses/BSD-3-Clause.
// SPDX-License-Identifier: BSD-3-Clause
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <vector>

#include <Vigil/Audit/Finding.h>
#include <Vigil/Audit/api_export.h>
#include <Vigil/Scene/SceneStore.h>

namespace vigil::audit::rules {

//! Reports driver chains through \p object, then per driver: invalid drivers,
//! self references, unset or dangling targets and blank scripted expressions.
VGL_AUD_NDAPI auto ValidateDrivers(const scene::SceneStore& store,
  const scene::SceneObject& object) -> std::vector<Issue>;

//! Removes the drivers of \p object_name that are invalid, have a blank
//! scripted expression, reference the object itself or have a missing target.
/*! \return the number of drivers removed. */
VGL_AUD_API auto FixInvalidDrivers(
  scene::SceneStore& store, std::string_view object_name) -> int;

//! Breaks the driver chain detected from \p object_name by removing the
//! drivers of that object which target any member of the chain.
/*!
 The repair is local: a cycle that does not pass through a target of this
 object survives it, and is broken, if at all, when one of its members is
 repaired.

 \return true if at least one driver was removed.
*/
VGL_AUD_API auto FixDriverChains(
  scene::SceneStore& store, std::string_view object_name) -> bool;

} // namespace vigil::audit::rules
