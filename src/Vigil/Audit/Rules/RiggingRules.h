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

//! Outcome of FixVertexGroups().
struct VertexGroupFixes {
  int empty_removed { 0 };
  int orphaned_removed { 0 };
  //! 1 when the normalization pass ran, 0 otherwise.
  int normalized { 0 };
};

//! Mesh objects only: empty and zero-weight vertex groups, and, when an
//! armature modifier names an armature object, groups without a matching
//! bone.
VGL_AUD_NDAPI auto ValidateVertexGroups(const scene::SceneStore& store,
  const scene::SceneObject& object) -> std::vector<Issue>;

//! Removes the empty, zero-weight and orphaned vertex groups of a mesh
//! object, then normalizes the remaining ones in weight paint mode.
/*!
 The normalization pass is skipped when the object is outside the view layer
 or cannot change mode; a failing pass is logged and reported as not run,
 the removals are kept.
*/
VGL_AUD_API auto FixVertexGroups(
  scene::SceneStore& store, std::string_view object_name) -> VertexGroupFixes;

} // namespace vigil::audit::rules
