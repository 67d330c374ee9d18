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

//! Checks the required references of each modifier of \p object.
/*!
 | Modifier       | Defect                                   | Severity |
 |----------------|------------------------------------------|----------|
 | Array          | object offset enabled without an object  | WARNING  |
 | Boolean        | no target, or target missing             | ERROR    |
 | Shrinkwrap     | no target                                | ERROR    |
 | Armature       | no armature object                       | ERROR    |
 | Surface Deform | not bound                                | ERROR    |
 | Surface Deform | target not in object mode                | ERROR    |
 | Data Transfer  | no source object                         | ERROR    |

 A reference naming an object that no longer exists counts as unset.
*/
VGL_AUD_NDAPI auto ValidateModifiers(const scene::SceneStore& store,
  const scene::SceneObject& object) -> std::vector<Issue>;

//! Disables the object offset of misconfigured Array modifiers and removes
//! the other broken modifiers, except a Surface Deform whose target is merely
//! in the wrong mode.
/*! \return the number of modifiers changed or removed. */
VGL_AUD_API auto FixBrokenModifiers(
  scene::SceneStore& store, std::string_view object_name) -> int;

} // namespace vigil::audit::rules
